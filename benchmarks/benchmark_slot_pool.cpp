#include <benchmark/benchmark.h>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "containers/slot_pool.hpp"
#include "engine/types.hpp"

// ----------------------------------------------------------------------------
// Baseline: a single mutex around a free list stack, for comparison with the
// per slot locks under contention.
// ----------------------------------------------------------------------------
class GlobalLockPool {
 private:
  std::mutex mut;
  std::vector<size_t> free_list;
  std::vector<Request> items;

 public:
  explicit GlobalLockPool(size_t capacity) : items(capacity) {
    for (size_t i = capacity; i > 0; i--) free_list.push_back(i - 1);
  }
  auto insert(const Request& request) -> std::optional<size_t> {
    std::lock_guard<std::mutex> lk(mut);
    if (free_list.empty()) return std::nullopt;
    size_t key = free_list.back();
    free_list.pop_back();
    items[key] = request;
    return key;
  }
  auto take(size_t key) -> Request {
    std::lock_guard<std::mutex> lk(mut);
    free_list.push_back(key);
    return items[key];
  }
};

static auto makeRequest(uint64_t i) -> Request {
  Request request{};
  request.request_id = i;
  request.client_id = 1;
  request.amount = static_cast<Amount>(i);
  return request;
}

// ----------------------------------------------------------------------------
// BENCHMARK: Single Thread Throughput
// ----------------------------------------------------------------------------
static void BM_SlotPool_InsertTake(benchmark::State& state) {
  threadsafe::slot_pool<Request> pool(state.range(0));
  uint64_t i = 0;
  for (auto _ : state) {
    std::optional<size_t> key = pool.insert(makeRequest(i++));
    benchmark::DoNotOptimize(pool.take(*key));
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SlotPool_InsertTake)->Arg(64)->Arg(1024)->Arg(65536);

static void BM_SlotPool_ReserveDrop(benchmark::State& state) {
  threadsafe::slot_pool<Request> pool(1024);
  for (auto _ : state) {
    auto slot = pool.reserve();
    benchmark::DoNotOptimize(slot);
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SlotPool_ReserveDrop);

static void BM_SlotPool_Get(benchmark::State& state) {
  threadsafe::slot_pool<Request> pool(1024);
  for (uint64_t i = 0; i < 1024; i++) pool.insert(makeRequest(i));
  size_t key = 0;
  for (auto _ : state) {
    auto entry = pool.get(key);
    benchmark::DoNotOptimize((*entry)->amount);
    key = (key + 1) & 1023;
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SlotPool_Get);

// ----------------------------------------------------------------------------
// BENCHMARK: Multi-Thread Contention
// Each benchmark thread inserts and takes back its own requests.
// ----------------------------------------------------------------------------
static threadsafe::slot_pool<Request>* shared_pool = nullptr;
static GlobalLockPool* shared_global = nullptr;

static void BM_SlotPool_Contention(benchmark::State& state) {
  if (state.thread_index() == 0) {
    shared_pool = new threadsafe::slot_pool<Request>(1024);
  }
  uint64_t i = 0;
  for (auto _ : state) {
    std::optional<size_t> key = shared_pool->insert(makeRequest(i++));
    if (key) benchmark::DoNotOptimize(shared_pool->take(*key));
  }
  state.SetItemsProcessed(state.iterations());
  if (state.thread_index() == 0) {
    delete shared_pool;
    shared_pool = nullptr;
  }
}
BENCHMARK(BM_SlotPool_Contention)->ThreadRange(1, 8)->UseRealTime();

static void BM_GlobalLock_Contention(benchmark::State& state) {
  if (state.thread_index() == 0) {
    shared_global = new GlobalLockPool(1024);
  }
  uint64_t i = 0;
  for (auto _ : state) {
    std::optional<size_t> key = shared_global->insert(makeRequest(i++));
    if (key) benchmark::DoNotOptimize(shared_global->take(*key));
  }
  state.SetItemsProcessed(state.iterations());
  if (state.thread_index() == 0) {
    delete shared_global;
    shared_global = nullptr;
  }
}
BENCHMARK(BM_GlobalLock_Contention)->ThreadRange(1, 8)->UseRealTime();

BENCHMARK_MAIN();
