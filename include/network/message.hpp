#pragma once

#include <cstddef>
#include <cstdint>

#include "engine/types.hpp"
#include "network/varint.hpp"

enum class MessageType : uint8_t { NOTICE = 1 };

// Byte 0 message type, then client id, sequence, key and zigzag amount,
// each as a varint.
static constexpr size_t MAX_NOTICE_SIZE = 1 + 4 * MAX_VARINT_SIZE;

// Returns number of bytes written, buffer must hold MAX_NOTICE_SIZE bytes.
auto serialise_notice(const Notice& notice, uint8_t* buffer) -> size_t;

// Returns false on a wrong message type, truncated field or trailing bytes.
auto deserialise_notice(const uint8_t* buffer, size_t len, Notice& notice)
    -> bool;

auto make_frame(const Notice& notice) -> Frame;
