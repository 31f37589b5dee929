#include "network/message.hpp"

#include <limits>
#include <optional>

auto serialise_notice(const Notice& notice, uint8_t* buffer) -> size_t {
  // Byte 0 : message type.
  buffer[0] = static_cast<uint8_t>(MessageType::NOTICE);
  size_t written = 1;
  written += encode_varint(notice.client_id, &buffer[written]);
  written += encode_varint(notice.sequence, &buffer[written]);
  written += encode_varint(notice.key, &buffer[written]);
  written += encode_varint(zigzag_encode(notice.amount), &buffer[written]);
  return written;
}

auto deserialise_notice(const uint8_t* buffer, size_t len, Notice& notice)
    -> bool {
  if (len == 0 || buffer[0] != static_cast<uint8_t>(MessageType::NOTICE)) {
    return false;
  }
  const uint8_t* cursor = buffer + 1;
  const uint8_t* end = buffer + len;

  std::optional<uint64_t> client_id = read_varint(cursor, end);
  std::optional<uint64_t> sequence = read_varint(cursor, end);
  std::optional<uint64_t> key = read_varint(cursor, end);
  std::optional<uint64_t> amount = read_varint(cursor, end);
  if (!client_id || !sequence || !key || !amount || cursor != end) {
    return false;
  }
  if (*client_id > std::numeric_limits<ClientId>::max()) {
    return false;
  }
  notice.client_id = static_cast<ClientId>(*client_id);
  notice.sequence = *sequence;
  notice.key = static_cast<SlotKey>(*key);
  notice.amount = zigzag_decode(*amount);
  return true;
}

auto make_frame(const Notice& notice) -> Frame {
  Frame frame;
  frame.bytes.resize(MAX_NOTICE_SIZE);
  frame.bytes.resize(serialise_notice(notice, frame.bytes.data()));
  return frame;
}
