#ifndef SEEN_WINDOW_HPP
#define SEEN_WINDOW_HPP

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <ostream>

// Fixed size bitmap over [first_index, first_index + 64 * N), used to drop
// duplicates from a best effort stream of mostly increasing indices.
// Inserting past the end slides the window forward, so an index lower than
// one already seen may be rejected even if it never arrived.
template <size_t N = 3>
class seen_window {
  static_assert(N >= 2, "seen_window needs at least two words to slide");

 private:
  static constexpr uint64_t WORD_BITS = 64;
  static constexpr size_t LEN = N * WORD_BITS;
  // Word an index lands in right after a slide.
  static constexpr size_t LANDING_WORD = (N + 1) / 2;

  std::array<uint64_t, N> map{};
  uint64_t first{0};

  [[nodiscard]] auto test(size_t offset) const -> bool {
    return (map[offset / WORD_BITS] >> (offset % WORD_BITS)) & 1;
  }

 public:
  class iterator {
   private:
    const seen_window* window{nullptr};
    size_t offset{LEN};

    void advance() {
      while (offset < LEN && !window->test(offset)) {
        offset++;
      }
    }

   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = uint64_t;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = uint64_t;

    iterator() = default;
    iterator(const seen_window* w, size_t start) : window(w), offset(start) {
      advance();
    }

    auto operator*() const -> uint64_t { return window->first + offset; }
    auto operator++() -> iterator& {
      offset++;
      advance();
      return *this;
    }
    auto operator++(int) -> iterator {
      iterator tmp = *this;
      ++*this;
      return tmp;
    }
    auto operator==(const iterator& other) const -> bool {
      return offset == other.offset;
    }
  };

  seen_window() = default;

  [[nodiscard]] auto first_index() const -> uint64_t { return first; }

  // True if insert(index) would return true.
  [[nodiscard]] auto can_insert(uint64_t index) const -> bool {
    if (index < first) {
      return false;
    }
    uint64_t offset = index - first;
    if (offset >= LEN) {
      return true;
    }
    return !test(offset);
  }

  // Marks index as seen. Returns false if it was seen before or has already
  // slid out of the window.
  auto insert(uint64_t index) -> bool {
    if (index < first) {
      return false;
    }
    uint64_t offset = index - first;
    uint64_t word_idx = offset / WORD_BITS;
    uint64_t word_offset = offset % WORD_BITS;
    if (word_idx >= N) {
      uint64_t gap = word_idx - N;
      size_t keep = gap < LANDING_WORD ? LANDING_WORD - gap : 0;
      std::copy(map.end() - keep, map.end(), map.begin());
      std::fill(map.begin() + keep, map.end(), 0);
      first += (gap + N / 2) * WORD_BITS;
      word_idx = LANDING_WORD;
    }
    uint64_t mask = uint64_t{1} << word_offset;
    bool fresh = (map[word_idx] & mask) == 0;
    map[word_idx] |= mask;
    return fresh;
  }

  [[nodiscard]] auto begin() const -> iterator { return iterator(this, 0); }
  [[nodiscard]] auto end() const -> iterator { return iterator(this, LEN); }

  friend auto operator<<(std::ostream& os, const seen_window& w)
      -> std::ostream& {
    os << "{";
    bool first_entry = true;
    for (uint64_t index : w) {
      os << (first_entry ? "" : ", ") << index;
      first_entry = false;
    }
    return os << "} first_index=" << w.first;
  }
};

#endif  // SEEN_WINDOW_HPP
