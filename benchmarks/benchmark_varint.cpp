#include <benchmark/benchmark.h>

#include <cstdint>
#include <random>
#include <vector>

#include "containers/seen_window.hpp"
#include "network/varint.hpp"

static std::vector<uint64_t> GetRandomValues(int count) {
  std::vector<uint64_t> values;
  values.reserve(count);
  std::mt19937_64 rng(12345);
  // Spread over every encoded length.
  for (int i = 0; i < count; ++i) values.push_back(rng() >> (rng() % 64));
  return values;
}

static void BM_Varint_Encode(benchmark::State& state) {
  std::vector<uint64_t> values = GetRandomValues(4096);
  uint8_t buffer[MAX_VARINT_SIZE];
  size_t i = 0;
  for (auto _ : state) {
    benchmark::DoNotOptimize(encode_varint(values[i++ & 4095], buffer));
    benchmark::ClobberMemory();
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Varint_Encode);

static void BM_Varint_Decode(benchmark::State& state) {
  std::vector<uint64_t> values = GetRandomValues(4096);
  std::vector<uint8_t> encoded(values.size() * MAX_VARINT_SIZE);
  size_t len = 0;
  for (uint64_t v : values) len += encode_varint(v, &encoded[len]);

  for (auto _ : state) {
    const uint8_t* cursor = encoded.data();
    const uint8_t* end = encoded.data() + len;
    while (auto v = read_varint(cursor, end)) {
      benchmark::DoNotOptimize(*v);
    }
  }
  state.SetItemsProcessed(state.iterations() * values.size());
}
BENCHMARK(BM_Varint_Decode);

static void BM_SeenWindow_Insert(benchmark::State& state) {
  for (auto _ : state) {
    seen_window<5> window;
    for (uint64_t i = 0; i < static_cast<uint64_t>(state.range(0)); i++) {
      benchmark::DoNotOptimize(window.insert(i));
    }
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SeenWindow_Insert)->Range(1024, 8 << 11);

BENCHMARK_MAIN();
