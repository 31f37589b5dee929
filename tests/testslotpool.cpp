#include "containers/slot_pool.hpp"
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <numeric>
#include <optional>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_set>
#include <vector>

using threadsafe::slot_pool;

// Value whose move constructor can be told to throw.
struct ThrowingMove {
  int value;
  static inline bool fail_moves = false;

  explicit ThrowingMove(int v) : value(v) {}
  ThrowingMove(ThrowingMove&& other) : value(other.value) {
    if (fail_moves) throw std::runtime_error("move failed");
  }
  auto operator=(ThrowingMove&&) -> ThrowingMove& = default;
};

// Reserves until exhaustion, holding every guard, and returns the keys.
template <typename T>
static std::vector<size_t> drainKeys(slot_pool<T>& pool) {
  std::vector<typename slot_pool<T>::reserved> held;
  std::vector<size_t> keys;
  while (auto slot = pool.reserve()) {
    keys.push_back(slot->key());
    held.push_back(std::move(*slot));
  }
  return keys;
}

class SlotPoolTest : public ::testing::Test {
 protected:
  slot_pool<int> pool{5};
};

// 1. Basic Functional Tests
TEST_F(SlotPoolTest, FreshPoolHandsOutEveryKey) {
  std::vector<size_t> keys = drainKeys(pool);
  ASSERT_EQ(keys.size(), 5);
  std::sort(keys.begin(), keys.end());
  for (size_t i = 0; i < keys.size(); i++) {
    EXPECT_EQ(keys[i], i);
  }
}

TEST_F(SlotPoolTest, InsertThenGetReturnsValue) {
  std::optional<size_t> key = pool.insert(42);
  ASSERT_TRUE(key.has_value());

  auto entry = pool.get(*key);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(**entry, 42);
  EXPECT_EQ(entry->key(), *key);
}

TEST_F(SlotPoolTest, InsertAndTake) {
  for (int i = 1; i <= 5; i++) {
    ASSERT_TRUE(pool.insert(i).has_value());
  }
  EXPECT_FALSE(pool.insert(6).has_value());

  EXPECT_EQ(pool.take(3), std::optional<int>(4));
  EXPECT_EQ(**pool.get(4), 5);
  // Only key 3 is free, so it comes straight back.
  EXPECT_EQ(pool.insert(10), std::optional<size_t>(3));
  EXPECT_EQ(**pool.get(3), 10);
}

TEST_F(SlotPoolTest, ValuesStayAtTheirKeys) {
  for (int i = 0; i < 5; i++) {
    pool.reserve()->insert(i);
  }
  EXPECT_FALSE(pool.reserve().has_value());
  for (int i = 0; i < 5; i++) {
    EXPECT_EQ(**pool.get(static_cast<size_t>(i)), i);
  }
}

TEST_F(SlotPoolTest, GetMutatesInPlace) {
  size_t key = *pool.insert(1);
  {
    auto entry = pool.get(key);
    **entry += 41;
  }
  EXPECT_EQ(**pool.get(key), 42);
}

// 2. Invalid keys
TEST_F(SlotPoolTest, GetAndTakeOutOfRange) {
  EXPECT_FALSE(pool.get(5).has_value());
  EXPECT_FALSE(pool.get(1000).has_value());
  EXPECT_FALSE(pool.take(5).has_value());
}

TEST_F(SlotPoolTest, GetAndTakeVacantKey) {
  EXPECT_FALSE(pool.get(0).has_value());
  EXPECT_FALSE(pool.take(0).has_value());

  size_t key = *pool.insert(7);
  EXPECT_EQ(pool.take(key), std::optional<int>(7));
  EXPECT_FALSE(pool.get(key).has_value());
  EXPECT_FALSE(pool.take(key).has_value());
  // The failed lookups must not have touched the free list.
  EXPECT_EQ(drainKeys(pool).size(), 5);
}

TEST(SlotPoolEdgeCases, ZeroCapacityIsAlwaysExhausted) {
  slot_pool<int> pool(0);
  EXPECT_EQ(pool.capacity(), 0);
  EXPECT_FALSE(pool.reserve().has_value());
  EXPECT_FALSE(pool.insert(1).has_value());
  EXPECT_FALSE(pool.get(0).has_value());
}

// 3. Guard lifecycle
TEST(SlotPoolGuards, ReserveGetAndTake) {
  slot_pool<int> slots(2);
  auto slot1 = slots.reserve();
  auto slot2 = slots.reserve();
  ASSERT_TRUE(slot1 && slot2);
  EXPECT_NE(slot1->key(), slot2->key());
  EXPECT_FALSE(slots.reserve().has_value());

  size_t key1 = slot1->insert(1).key();
  slot2.reset();  // Dropping a reserved guard frees its key.
  slot2 = slots.reserve();
  ASSERT_TRUE(slot2.has_value());
  EXPECT_FALSE(slots.reserve().has_value());
  EXPECT_EQ(**slots.get(key1), 1);

  size_t key2 = slot2->insert(2).key();
  EXPECT_FALSE(slots.reserve().has_value());

  auto entry = slots.get(key2);
  ASSERT_TRUE(entry.has_value());
  auto [val, vac] = entry->take();
  EXPECT_EQ(val, 2);
  EXPECT_EQ(vac.key(), key2);
  {
    auto dropped = std::move(vac);
  }

  auto again = slots.reserve();
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->key(), key2);
  EXPECT_FALSE(slots.reserve().has_value());
}

TEST(SlotPoolGuards, DroppingOccupiedKeepsValue) {
  slot_pool<std::string> pool(1);
  size_t key = 0;
  {
    auto entry = pool.reserve()->insert("kept");
    key = entry.key();
  }
  EXPECT_FALSE(pool.reserve().has_value());
  EXPECT_EQ(**pool.get(key), "kept");
  EXPECT_EQ((*pool.get(key))->size(), 4);
}

TEST(SlotPoolGuards, TakeThenReinsertSameKey) {
  slot_pool<int> pool(3);
  size_t key = *pool.insert(5);
  auto entry = pool.get(key);
  auto [value, slot] = entry->take();
  EXPECT_EQ(value, 5);
  auto refilled = slot.insert(value * 2);
  EXPECT_EQ(refilled.key(), key);
  EXPECT_EQ(*refilled, 10);
}

TEST(SlotPoolGuards, MovedFromGuardDoesNotReleaseTwice) {
  slot_pool<int> pool(2);
  {
    auto first = pool.reserve();
    auto moved = std::move(*first);
    // Both the moved-from optional and the new guard go out of scope here.
  }
  EXPECT_EQ(drainKeys(pool).size(), 2);
}

TEST(SlotPoolGuards, MoveOnlyValues) {
  slot_pool<std::unique_ptr<int>> pool(2);
  size_t key = *pool.insert(std::make_unique<int>(9));
  EXPECT_EQ(***pool.get(key), 9);
  std::optional<std::unique_ptr<int>> out = pool.take(key);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(**out, 9);
}

TEST(SlotPoolGuards, ConstGuardGivesConstAccess) {
  slot_pool<int> pool(1);
  size_t key = *pool.insert(11);
  auto entry = pool.get(key);
  ASSERT_TRUE(entry.has_value());
  const auto& view = *entry;
  static_assert(std::is_same_v<decltype(*view), const int&>);
  EXPECT_EQ(*view, 11);
  **entry = 12;
  EXPECT_EQ(*view, 12);
}

TEST(SlotPoolGuards, ThrowingInsertKeepsSlotVacant) {
  slot_pool<ThrowingMove> pool(1);
  ThrowingMove::fail_moves = true;
  EXPECT_THROW(
      {
        auto slot = pool.reserve();
        ASSERT_TRUE(slot.has_value());
        slot->insert(ThrowingMove(1));
      },
      std::runtime_error);
  ThrowingMove::fail_moves = false;

  // The key went back to the free list and reads as vacant.
  EXPECT_FALSE(pool.get(0).has_value());
  EXPECT_FALSE(pool.take(0).has_value());
  auto slot = pool.reserve();
  ASSERT_TRUE(slot.has_value());
  EXPECT_EQ(slot->key(), 0);
  EXPECT_EQ(slot->insert(ThrowingMove(2))->value, 2);
}

// Capacity two: exhaust, free one key and get the same key back.
TEST(SlotPoolGuards, ExhaustTakeAndReuse) {
  slot_pool<int> pool(2);
  size_t a = *pool.insert(1);
  size_t b = *pool.insert(2);
  EXPECT_FALSE(pool.reserve().has_value());
  EXPECT_EQ(pool.take(a), std::optional<int>(1));
  auto fourth = pool.reserve();
  ASSERT_TRUE(fourth.has_value());
  EXPECT_EQ(fourth->key(), a);
  EXPECT_EQ(**pool.get(b), 2);
}

TEST(SlotPoolGuards, NoLostSlotsAfterMixedOperations) {
  slot_pool<int> pool(16);
  std::mt19937 rng(12345);
  std::vector<size_t> live;
  for (int step = 0; step < 10000; step++) {
    switch (rng() % 4) {
      case 0:
      case 1: {
        if (auto key = pool.insert(step)) live.push_back(*key);
        break;
      }
      case 2: {
        if (!live.empty()) {
          size_t idx = rng() % live.size();
          ASSERT_TRUE(pool.take(live[idx]).has_value());
          live.erase(live.begin() + static_cast<long>(idx));
        }
        break;
      }
      case 3: {
        auto slot = pool.reserve();  // Claimed then abandoned.
        break;
      }
    }
  }
  for (size_t key : live) {
    ASSERT_TRUE(pool.take(key).has_value());
  }
  EXPECT_EQ(drainKeys(pool).size(), 16);
}

// 4. Rigorous Concurrency
TEST(SlotPoolConcurrency, DistinctKeysUnderConcurrentReserve) {
  constexpr size_t num_threads = 64;
  slot_pool<int> pool(num_threads);
  std::vector<size_t> keys(num_threads, slot_pool<int>::npos);
  std::atomic<bool> go{false};
  std::atomic<size_t> holding{0};
  std::atomic<bool> exhausted_seen{false};

  std::vector<std::thread> threads;
  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([&, i]() {
      while (!go.load(std::memory_order_acquire)) std::this_thread::yield();
      auto guard = pool.reserve();
      if (guard) keys[i] = guard->key();
      // Keep every guard alive until all threads have one, guards must be
      // dropped on the thread that took them.
      holding.fetch_add(1);
      while (holding.load() < num_threads) std::this_thread::yield();
      if (i == 0 && !pool.reserve().has_value()) exhausted_seen.store(true);
      holding.fetch_add(1);
      while (holding.load() < 2 * num_threads) std::this_thread::yield();
    });
  }
  go.store(true, std::memory_order_release);
  for (auto& t : threads) t.join();

  std::set<size_t> distinct(keys.begin(), keys.end());
  EXPECT_EQ(distinct.size(), num_threads);
  EXPECT_EQ(distinct.count(slot_pool<int>::npos), 0);
  EXPECT_TRUE(exhausted_seen.load());
  EXPECT_EQ(drainKeys(pool).size(), num_threads);
}

TEST(SlotPoolConcurrency, ThreadedInsertsAreAllStored) {
  slot_pool<int> pool(100);
  std::vector<int> values(100);
  std::iota(values.begin(), values.end(), 1000);

  std::vector<std::thread> threads;
  for (int value : values) {
    threads.emplace_back([&pool, value]() {
      ASSERT_TRUE(pool.reserve()->insert(value).key() < 100);
    });
  }
  for (auto& t : threads) t.join();

  std::unordered_set<int> stored;
  for (size_t i = 0; i < values.size(); i++) {
    auto entry = pool.get(i);
    ASSERT_TRUE(entry.has_value()) << "Missing key: " << i;
    stored.insert(**entry);
  }
  EXPECT_EQ(stored, std::unordered_set<int>(values.begin(), values.end()));
}

TEST(SlotPoolConcurrency, CapacityBoundHolds) {
  constexpr size_t capacity = 8;
  constexpr int num_threads = 32;
  slot_pool<int> pool(capacity);

  // Every thread reserves once and holds on until all have tried, so exactly
  // capacity of them get a slot.
  std::atomic<int> attempted{0};
  std::atomic<size_t> granted{0};
  std::atomic<size_t> exhausted{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([&]() {
      auto slot = pool.reserve();
      if (slot) {
        granted.fetch_add(1);
      } else {
        exhausted.fetch_add(1);
      }
      attempted.fetch_add(1);
      while (attempted.load() < num_threads) {
        std::this_thread::yield();
      }
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(granted.load(), capacity);
  EXPECT_EQ(exhausted.load(), num_threads - capacity);

  // Free running: guards held across a yield never exceed capacity.
  std::atomic<size_t> outstanding{0};
  std::atomic<size_t> max_outstanding{0};
  threads.clear();
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 2000; ++i) {
        auto slot = pool.reserve();
        if (!slot) continue;
        size_t now = outstanding.fetch_add(1) + 1;
        size_t prev = max_outstanding.load();
        while (now > prev && !max_outstanding.compare_exchange_weak(prev, now)) {
        }
        std::this_thread::yield();
        outstanding.fetch_sub(1);
      }
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_LE(max_outstanding.load(), capacity);
  EXPECT_EQ(drainKeys(pool).size(), capacity);
}

// Reserve and drop from several threads against a tiny pool. Each call has
// to come back, and afterwards both slots are still reachable.
static void hammerReserve(size_t capacity, int num_threads, int iterations,
                          std::atomic<long>& successes) {
  slot_pool<int> pool(capacity);
  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < iterations; ++i) {
        if (pool.reserve().has_value()) {
          successes.fetch_add(1, std::memory_order_relaxed);
        }
      }
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(drainKeys(pool).size(), capacity);
}

TEST(SlotPoolConcurrency, NoDeadlockSingleSlot) {
  std::atomic<long> successes{0};
  hammerReserve(1, 2, 100000, successes);
  EXPECT_GE(successes.load(), 1);
}

TEST(SlotPoolConcurrency, NoInterferenceTwoSlots) {
  // Two threads, two slots, guards dropped immediately: nobody ever finds
  // the pool exhausted.
  std::atomic<long> successes{0};
  hammerReserve(2, 2, 100000, successes);
  EXPECT_EQ(successes.load(), 200000);
}

TEST(SlotPoolConcurrency, NoDeadlockFourThreads) {
  std::atomic<long> successes{0};
  hammerReserve(2, 4, 100000, successes);
  EXPECT_GE(successes.load(), 100000);
}

TEST(SlotPoolConcurrency, ConcurrentInsertTakeKeepsFreeList) {
  constexpr size_t capacity = 32;
  slot_pool<long> pool(capacity);
  std::atomic<long> taken_sum{0};
  std::atomic<long> inserted_sum{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&, t]() {
      for (long i = 0; i < 20000; ++i) {
        long value = t * 100000 + i;
        auto key = pool.insert(value);
        if (!key) continue;
        inserted_sum.fetch_add(value);
        // Only this thread knows the key, so the take cannot miss.
        std::optional<long> out = pool.take(*key);
        ASSERT_TRUE(out.has_value());
        EXPECT_EQ(*out, value);
        taken_sum.fetch_add(*out);
      }
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(inserted_sum.load(), taken_sum.load());
  EXPECT_EQ(drainKeys(pool).size(), capacity);
}

TEST(SlotPoolConcurrency, ConcurrentGetSerializesPerKey) {
  slot_pool<long> pool(4);
  size_t key = *pool.insert(0);
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 10000; ++i) {
        auto entry = pool.get(key);
        ASSERT_TRUE(entry.has_value());
        **entry += 1;  // Plain increment, the slot lock is the only guard.
      }
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(**pool.get(key), 80000);
}

TEST(SlotPoolConcurrency, HandOffKeysBetweenThreads) {
  constexpr size_t capacity = 16;
  constexpr int items = 50000;
  slot_pool<int> pool(capacity);
  std::vector<std::atomic<long>> mailbox(capacity);
  for (auto& m : mailbox) m.store(-1);

  std::atomic<bool> done{false};
  long consumed_sum = 0;

  std::thread consumer([&]() {
    int consumed = 0;
    while (consumed < items) {
      for (size_t k = 0; k < capacity; ++k) {
        // Clear the mailbox before the take frees the key for reuse.
        long sent = mailbox[k].exchange(-1, std::memory_order_acq_rel);
        if (sent == -1) continue;
        std::optional<int> value = pool.take(k);
        EXPECT_EQ(value, std::optional<int>(static_cast<int>(sent)));
        if (value) consumed_sum += *value;
        consumed++;
      }
    }
    done.store(true);
  });

  long produced_sum = 0;
  for (int i = 0; i < items; ++i) {
    std::optional<size_t> key;
    while (!(key = pool.insert(i))) std::this_thread::yield();
    mailbox[*key].store(i, std::memory_order_release);
    produced_sum += i;
  }
  consumer.join();
  EXPECT_TRUE(done.load());
  EXPECT_EQ(produced_sum, consumed_sum);
  EXPECT_EQ(drainKeys(pool).size(), capacity);
}

// 5. Fatal misuse
TEST(SlotPoolDeathTest, InsertThroughEmptyGuardAborts) {
  slot_pool<int> pool(1);
  EXPECT_DEATH(
      {
        auto slot = pool.reserve();
        slot->insert(1);
        slot->insert(2);
      },
      "invariant violated");
}
