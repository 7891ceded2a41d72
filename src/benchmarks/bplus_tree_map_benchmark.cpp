// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <absl/container/btree_map.h>
#include <ankerl/unordered_dense.h>
#include <benchmark/benchmark.h>

#include <algorithm>
#include <cstdint>
#include <leafchain/bplus_tree_map.hpp>
#include <map>
#include <random>
#include <unordered_set>
#include <vector>

using namespace leafchain;

// Generate unique random keys for benchmarking
std::vector<int64_t> GenerateUniqueKeys(std::size_t count) {
  std::mt19937_64 rng(42);
  std::uniform_int_distribution<int64_t> dist;
  std::unordered_set<int64_t> unique_keys;

  // Keep generating until we have enough unique keys
  while (unique_keys.size() < count) {
    unique_keys.insert(dist(rng));
  }

  return std::vector<int64_t>(unique_keys.begin(), unique_keys.end());
}

// Thin adapters so every container is driven through the same calls
template <std::size_t Order>
struct BPlusTreeMapAdapter {
  bplus_tree_map<int64_t, int64_t> map{Order};
  void put(int64_t key, int64_t value) { map.put(key, value); }
  const int64_t* get(int64_t key) const {
    auto it = map.find(key);
    return it == map.end() ? nullptr : &it->second;
  }
  int64_t sum() const {
    int64_t total = 0;
    for (auto [key, value] : map) {
      total += value;
    }
    return total;
  }
};

template <typename Map>
struct StandardMapAdapter {
  Map map;
  void put(int64_t key, int64_t value) { map.insert_or_assign(key, value); }
  const int64_t* get(int64_t key) const {
    auto it = map.find(key);
    return it == map.end() ? nullptr : &it->second;
  }
  int64_t sum() const {
    int64_t total = 0;
    for (const auto& [key, value] : map) {
      total += value;
    }
    return total;
  }
};

using StdMap = StandardMapAdapter<std::map<int64_t, int64_t>>;
using AbslMap = StandardMapAdapter<absl::btree_map<int64_t, int64_t>>;
using DenseMap =
    StandardMapAdapter<ankerl::unordered_dense::map<int64_t, int64_t>>;

// Builds a container of state.range(0) random keys per iteration
template <typename Adapter>
static void BM_Put(benchmark::State& state) {
  auto keys = GenerateUniqueKeys(state.range(0));
  for (auto _ : state) {
    Adapter adapter;
    for (auto key : keys) {
      adapter.put(key, key);
    }
    benchmark::DoNotOptimize(adapter);
    benchmark::ClobberMemory();
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

// Looks up every key of a pre-built container
template <typename Adapter>
static void BM_Get(benchmark::State& state) {
  auto keys = GenerateUniqueKeys(state.range(0));
  Adapter adapter;
  for (auto key : keys) {
    adapter.put(key, key);
  }
  std::shuffle(keys.begin(), keys.end(), std::mt19937_64(7));

  for (auto _ : state) {
    for (auto key : keys) {
      benchmark::DoNotOptimize(adapter.get(key));
    }
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

// Visits every entry in iteration order
template <typename Adapter>
static void BM_Iterate(benchmark::State& state) {
  auto keys = GenerateUniqueKeys(state.range(0));
  Adapter adapter;
  for (auto key : keys) {
    adapter.put(key, key);
  }

  for (auto _ : state) {
    benchmark::DoNotOptimize(adapter.sum());
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_Put<BPlusTreeMapAdapter<4>>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Put<BPlusTreeMapAdapter<16>>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Put<BPlusTreeMapAdapter<64>>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Put<StdMap>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Put<AbslMap>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Put<DenseMap>)->Range(1 << 10, 1 << 18);

BENCHMARK(BM_Get<BPlusTreeMapAdapter<4>>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Get<BPlusTreeMapAdapter<16>>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Get<BPlusTreeMapAdapter<64>>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Get<StdMap>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Get<AbslMap>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Get<DenseMap>)->Range(1 << 10, 1 << 18);

BENCHMARK(BM_Iterate<BPlusTreeMapAdapter<16>>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Iterate<StdMap>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Iterate<AbslMap>)->Range(1 << 10, 1 << 18);

BENCHMARK_MAIN();
