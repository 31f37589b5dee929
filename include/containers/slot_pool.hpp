#ifndef SLOT_POOL_HPP
#define SLOT_POOL_HPP

#include <atomic>
#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace threadsafe {

// Fixed capacity pool of independently locked slots addressed by small
// integer keys. Vacant slots are threaded into a free list whose head lives
// in a single atomic word, so claiming a slot never takes a pool wide lock.
//
// Lifecycle of a key:
//   vacant (in free list) -> reserve() -> reserved -> insert() -> occupied
//   occupied -> take() -> reserved -> dropped -> vacant (back in free list)
// Dropping an occupied guard only unlocks, the value stays for a later get().
// Guards own a std::mutex lock, so they must be dropped on the thread that
// obtained them. Keys are what gets passed between threads.
template <typename T>
class slot_pool {
 private:
  static constexpr size_t CACHE_LINE = 64;

  struct vacant {
    size_t next;  // Next vacant key, capacity() ends the list.
  };

  // Each slot on its own cache line so neighbouring locks don't false share.
  struct alignas(CACHE_LINE) slot {
    std::mutex mut;
    std::variant<vacant, T> state{vacant{0}};
  };

  std::vector<slot> slots;
  alignas(CACHE_LINE) std::atomic<size_t> head{0};

  [[noreturn]] static void invariant_violation(const char* what, size_t key) {
    std::cerr << "slot_pool: internal invariant violated (" << what
              << ") at key " << key << std::endl;
    std::abort();
  }

  // Push a key we hold the lock of onto the free list.
  void release(slot& s, size_t key) {
    size_t current = head.load(std::memory_order_acquire);
    do {
      s.state = vacant{current};
    } while (!head.compare_exchange_weak(current, key,
                                         std::memory_order_acq_rel,
                                         std::memory_order_acquire));
  }

  // Common part of both guards: an exclusive lock on one slot plus its key.
  // Whoever holds the last live slot_ref for a vacant slot returns the key to
  // the free list on destruction.
  class slot_ref {
   private:
    slot_pool* pool{nullptr};
    std::unique_lock<std::mutex> lock;
    size_t slot_key{0};

   public:
    slot_ref(slot_pool* p, std::unique_lock<std::mutex>&& lk, size_t key)
        : pool(p), lock(std::move(lk)), slot_key(key) {}

    slot_ref(const slot_ref&) = delete;
    auto operator=(const slot_ref&) -> slot_ref& = delete;

    slot_ref(slot_ref&& other) noexcept
        : pool(std::exchange(other.pool, nullptr)),
          lock(std::move(other.lock)),
          slot_key(other.slot_key) {}

    auto operator=(slot_ref&& other) noexcept -> slot_ref& {
      if (this != &other) {
        reset();
        pool = std::exchange(other.pool, nullptr);
        lock = std::move(other.lock);
        slot_key = other.slot_key;
      }
      return *this;
    }

    ~slot_ref() { reset(); }

    void reset() {
      if (pool == nullptr) {
        return;
      }
      slot& s = pool->slots[slot_key];
      if (std::holds_alternative<vacant>(s.state)) {
        pool->release(s, slot_key);
      }
      lock.unlock();
      pool = nullptr;
    }

    [[nodiscard]] auto valid() const -> bool { return pool != nullptr; }
    [[nodiscard]] auto key() const -> size_t { return slot_key; }
    auto state() const -> std::variant<vacant, T>& {
      return pool->slots[slot_key].state;
    }
  };

 public:
  class reserved;

  // Exclusive access to a slot holding a value.
  class occupied {
   private:
    slot_ref ref;
    friend class slot_pool;
    friend class reserved;

    explicit occupied(slot_ref&& r) : ref(std::move(r)) {}

    auto item() -> T& {
      T* value = std::get_if<T>(&ref.state());
      if (value == nullptr) {
        invariant_violation("occupied guard over vacant slot", ref.key());
      }
      return *value;
    }
    auto item() const -> const T& {
      const T* value = std::get_if<T>(&ref.state());
      if (value == nullptr) {
        invariant_violation("occupied guard over vacant slot", ref.key());
      }
      return *value;
    }

   public:
    occupied(occupied&&) noexcept = default;
    auto operator=(occupied&&) noexcept -> occupied& = default;

    [[nodiscard]] auto key() const -> size_t { return ref.key(); }

    auto operator*() -> T& { return item(); }
    auto operator*() const -> const T& { return item(); }
    auto operator->() -> T* { return &item(); }
    auto operator->() const -> const T* { return &item(); }

    // Moves the value out and hands back a reserved guard for the same key.
    // The guard is left empty.
    auto take() -> std::pair<T, reserved> {
      T value = std::move(item());
      ref.state() = vacant{slot_pool::npos};
      return {std::move(value), reserved(std::move(ref))};
    }
  };

  // Exclusive claim on a vacant slot that has been unlinked from the free
  // list. Dropping it without insert() relinks the key.
  class reserved {
   private:
    slot_ref ref;
    friend class slot_pool;
    friend class occupied;

    explicit reserved(slot_ref&& r) : ref(std::move(r)) {}

   public:
    reserved(reserved&&) noexcept = default;
    auto operator=(reserved&&) noexcept -> reserved& = default;

    [[nodiscard]] auto key() const -> size_t { return ref.key(); }

    // Stores item and converts this guard, lock included, into an occupied
    // guard. This guard is left empty.
    auto insert(T item) -> occupied {
      if (!ref.valid()) {
        invariant_violation("insert through an empty reserved guard", 0);
      }
      if (!std::holds_alternative<vacant>(ref.state())) {
        invariant_violation("reserved guard over occupied slot", ref.key());
      }
      // A throwing move leaves the variant valueless. Put the slot back to
      // vacant so dropping this guard still relinks the key.
      try {
        ref.state().template emplace<T>(std::move(item));
      } catch (...) {
        ref.state() = vacant{slot_pool::npos};
        throw;
      }
      return occupied(std::move(ref));
    }
  };

  static constexpr size_t npos = static_cast<size_t>(-1);

  explicit slot_pool(size_t capacity) : slots(capacity) {
    for (size_t i = 0; i < capacity; i++) {
      slots[i].state = vacant{i + 1};
    }
    head.store(0, std::memory_order_release);  // == capacity when empty pool.
  }

  slot_pool(const slot_pool&) = delete;
  auto operator=(const slot_pool&) -> slot_pool& = delete;
  slot_pool(slot_pool&&) = delete;
  auto operator=(slot_pool&&) -> slot_pool& = delete;

  [[nodiscard]] auto capacity() const -> size_t { return slots.size(); }

  // Claims some vacant slot, or nullopt if the pool is exhausted.
  // Never holds more than one slot lock at a time.
  auto reserve() -> std::optional<reserved> {
    while (true) {
      size_t key = head.load(std::memory_order_acquire);
      if (key >= slots.size()) {
        return std::nullopt;
      }
      slot& s = slots[key];
      std::unique_lock<std::mutex> lock(s.mut);

      const vacant* v = std::get_if<vacant>(&s.state);
      if (v == nullptr) {
        // Lost the race, the key was popped and filled meanwhile. While we
        // hold the lock nobody can push it back, so the head must have moved.
        if (head.load(std::memory_order_acquire) == key) {
          invariant_violation("free list head names an occupied slot", key);
        }
        continue;
      }
      // Only pop if key is still on top. A release may have pushed another
      // key since we read the head, and a plain store would lose it.
      size_t expected = key;
      if (head.compare_exchange_strong(expected, v->next,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        s.state = vacant{npos};
        return reserved(slot_ref(this, std::move(lock), key));
      }
    }
  }

  auto get(size_t key) -> std::optional<occupied> {
    if (key >= slots.size()) {
      return std::nullopt;
    }
    std::unique_lock<std::mutex> lock(slots[key].mut);
    if (std::holds_alternative<vacant>(slots[key].state)) {
      return std::nullopt;
    }
    return occupied(slot_ref(this, std::move(lock), key));
  }

  // Removes the value and relinks the key right away.
  auto take(size_t key) -> std::optional<T> {
    std::optional<occupied> entry = get(key);
    if (!entry) {
      return std::nullopt;
    }
    return std::move(entry->take().first);
  }

  auto insert(T item) -> std::optional<size_t> {
    std::optional<reserved> entry = reserve();
    if (!entry) {
      return std::nullopt;
    }
    return entry->insert(std::move(item)).key();
  }
};

}  // namespace threadsafe

#endif  // SLOT_POOL_HPP
