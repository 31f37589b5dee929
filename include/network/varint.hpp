#ifndef VARINT_HPP
#define VARINT_HPP

#include <cstddef>
#include <cstdint>
#include <optional>

// Prefix encoded variable length integers, 1 to 9 bytes.
//
// The number of leading ones in the first byte is the number of extra bytes,
// the remaining bits of the first byte are the most significant value bits:
//
//   0xxx_xxxx                  1 byte,   7 value bits
//   10xx_xxxx + 1 byte         2 bytes, 14 value bits
//   110x_xxxx + 2 bytes        3 bytes, 21 value bits
//   ...
//   1111_1110 + 7 bytes        8 bytes, 56 value bits
//   1111_1111 + 8 bytes        9 bytes, full 64 bit big endian value
//
// e.g. 456 = 0b1_1100_1000 -> 1000_0001 1100_1000.

static constexpr size_t MAX_VARINT_SIZE = 9;

// Length of a varint given its first byte.
auto decode_varint_len(uint8_t first) -> size_t;

// Number of bytes encode_varint() writes for val.
auto varint_size(uint64_t val) -> size_t;

// Writes val into buffer (at least MAX_VARINT_SIZE bytes) and returns the
// number of bytes written.
auto encode_varint(uint64_t val, uint8_t* buffer) -> size_t;

// Decodes a varint whose length is already known. len must be in [1, 9].
auto decode_varint_unchecked(const uint8_t* src, size_t len) -> uint64_t;

// Decodes a varint, nullopt if src is empty or truncated.
auto decode_varint(const uint8_t* src, size_t available)
    -> std::optional<uint64_t>;

// Decodes a varint at cursor and advances it past the varint on success.
auto read_varint(const uint8_t*& cursor, const uint8_t* end)
    -> std::optional<uint64_t>;

// Maps signed values to unsigned so small magnitudes stay short:
// 0 -> 0, -1 -> 1, 1 -> 2, -2 -> 3 ...
constexpr auto zigzag_encode(int64_t val) -> uint64_t {
  return (static_cast<uint64_t>(val) << 1) ^ static_cast<uint64_t>(val >> 63);
}

constexpr auto zigzag_decode(uint64_t val) -> int64_t {
  return static_cast<int64_t>(val >> 1) ^ -static_cast<int64_t>(val & 1);
}

#endif  // VARINT_HPP
