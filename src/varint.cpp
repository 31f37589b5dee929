#include "network/varint.hpp"

#include <endian.h>

#include <bit>
#include <cstring>
#include <stdexcept>

auto decode_varint_len(uint8_t first) -> size_t {
  return static_cast<size_t>(std::countl_one(first)) + 1;
}

auto varint_size(uint64_t val) -> size_t {
  size_t bits = 64 - static_cast<size_t>(std::countl_zero(val));
  size_t len = (bits + 6) / 7;  // ceil(bits / 7)
  if (len <= 1) {
    return 1;
  }
  if (len >= MAX_VARINT_SIZE) {
    return MAX_VARINT_SIZE;
  }
  return len;
}

auto encode_varint(uint64_t val, uint8_t* buffer) -> size_t {
  size_t len = varint_size(val);
  if (len == 1) {
    buffer[0] = static_cast<uint8_t>(val);
    return 1;
  }
  uint64_t network_val = htobe64(val);
  if (len == MAX_VARINT_SIZE) {
    buffer[0] = 0xFF;
    std::memcpy(&buffer[1], &network_val, 8);
    return MAX_VARINT_SIZE;
  }
  // Low len bytes of the big endian value, then stamp the length prefix
  // over the top bits of the first byte.
  auto len_prefix = static_cast<uint8_t>(0xFFu << (9 - len));
  auto msb_mask = static_cast<uint8_t>(0xFFu >> len);
  std::memcpy(buffer, reinterpret_cast<uint8_t*>(&network_val) + (8 - len),
              len);
  buffer[0] = static_cast<uint8_t>((buffer[0] & msb_mask) | len_prefix);
  return len;
}

auto decode_varint_unchecked(const uint8_t* src, size_t len) -> uint64_t {
  if (len == 0 || len > MAX_VARINT_SIZE) {
    throw std::invalid_argument("varint length must be between 1 and 9");
  }
  uint64_t network_val = 0;
  if (len == MAX_VARINT_SIZE) {
    std::memcpy(&network_val, &src[1], 8);
    return be64toh(network_val);
  }
  // Length 8 has no value bits in the first byte.
  auto msb_mask = static_cast<uint8_t>(0xFFu >> len);
  auto* bytes = reinterpret_cast<uint8_t*>(&network_val);
  std::memcpy(bytes + (8 - len), src, len);
  bytes[8 - len] &= msb_mask;
  return be64toh(network_val);
}

auto decode_varint(const uint8_t* src, size_t available)
    -> std::optional<uint64_t> {
  if (available == 0) {
    return std::nullopt;
  }
  size_t len = decode_varint_len(src[0]);
  if (len > available) {
    return std::nullopt;
  }
  return decode_varint_unchecked(src, len);
}

auto read_varint(const uint8_t*& cursor, const uint8_t* end)
    -> std::optional<uint64_t> {
  if (cursor >= end) {
    return std::nullopt;
  }
  auto available = static_cast<size_t>(end - cursor);
  std::optional<uint64_t> val = decode_varint(cursor, available);
  if (val) {
    cursor += decode_varint_len(cursor[0]);
  }
  return val;
}
