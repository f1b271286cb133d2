// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <absl/container/btree_map.h>
#include <benchmark/benchmark.h>

#include <cstddef>
#include <iterator>
#include <map>
#include <random>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <vector>
#include <wavl_containers/wavl_tree.hpp>

using namespace kressler::wavl_containers;

namespace {

// Generate unique random keys for benchmarking
std::vector<int> GenerateUniqueKeys(std::size_t count) {
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> dist(1, 1 << 30);
  std::unordered_set<int> unique_keys;

  // Keep generating until we have enough unique keys
  while (unique_keys.size() < count) {
    unique_keys.insert(dist(rng));
  }

  return std::vector<int>(unique_keys.begin(), unique_keys.end());
}

// Uniform insert over the three containers: wavl_tree reports rebalancing
// work, the others a std::pair
template <typename Map>
void Insert(Map& map, int key) {
  if constexpr (std::is_same_v<Map, wavl_map>) {
    benchmark::DoNotOptimize(map.insert(key, std::string()));
  } else {
    benchmark::DoNotOptimize(map.insert({key, std::string()}));
  }
}

template <typename Map>
bool Contains(const Map& map, int key) {
  return map.find(key) != map.end();
}

}  // namespace

// Build a container of state.range(0) random keys from scratch
template <typename Map>
static void BM_Insert(benchmark::State& state) {
  const auto keys = GenerateUniqueKeys(state.range(0));
  for (auto _ : state) {
    Map map;
    for (int key : keys) {
      Insert(map, key);
    }
    benchmark::ClobberMemory();
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

// Build a container from ascending keys (worst case for unbalanced trees)
template <typename Map>
static void BM_InsertAscending(benchmark::State& state) {
  for (auto _ : state) {
    Map map;
    for (int key = 0; key < state.range(0); ++key) {
      Insert(map, key);
    }
    benchmark::ClobberMemory();
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

// Look up every key of a pre-populated container
template <typename Map>
static void BM_Find(benchmark::State& state) {
  const auto keys = GenerateUniqueKeys(state.range(0));
  Map map;
  for (int key : keys) {
    Insert(map, key);
  }

  for (auto _ : state) {
    std::size_t found = 0;
    for (int key : keys) {
      found += Contains(map, key) ? 1 : 0;
    }
    benchmark::DoNotOptimize(found);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

// Erase and re-insert one key in a container of state.range(0) keys
template <typename Map>
static void BM_EraseInsert(benchmark::State& state) {
  const auto keys = GenerateUniqueKeys(state.range(0));
  Map map;
  for (int key : keys) {
    Insert(map, key);
  }

  std::size_t index = 0;
  for (auto _ : state) {
    const int key = keys[index];
    benchmark::DoNotOptimize(map.erase(key));
    Insert(map, key);
    index = (index + 1) % keys.size();
  }
  state.SetItemsProcessed(state.iterations());
}

// Order-statistic lookup; std::map has to walk linearly
template <typename Map>
static void BM_Select(benchmark::State& state) {
  const auto keys = GenerateUniqueKeys(state.range(0));
  Map map;
  for (int key : keys) {
    Insert(map, key);
  }

  std::mt19937 rng(7);
  std::uniform_int_distribution<std::size_t> rank_dist(1, keys.size());
  for (auto _ : state) {
    const std::size_t rank = rank_dist(rng);
    if constexpr (std::is_same_v<Map, wavl_map>) {
      benchmark::DoNotOptimize(map.select(rank));
    } else {
      benchmark::DoNotOptimize(std::next(map.begin(), rank - 1)->second);
    }
  }
  state.SetItemsProcessed(state.iterations());
}

using StdMap = std::map<int, std::string>;
using AbslMap = absl::btree_map<int, std::string>;

BENCHMARK_TEMPLATE(BM_Insert, wavl_map)->Range(1 << 10, 1 << 18);
BENCHMARK_TEMPLATE(BM_Insert, StdMap)->Range(1 << 10, 1 << 18);
BENCHMARK_TEMPLATE(BM_Insert, AbslMap)->Range(1 << 10, 1 << 18);

BENCHMARK_TEMPLATE(BM_InsertAscending, wavl_map)->Range(1 << 10, 1 << 18);
BENCHMARK_TEMPLATE(BM_InsertAscending, StdMap)->Range(1 << 10, 1 << 18);
BENCHMARK_TEMPLATE(BM_InsertAscending, AbslMap)->Range(1 << 10, 1 << 18);

BENCHMARK_TEMPLATE(BM_Find, wavl_map)->Range(1 << 10, 1 << 18);
BENCHMARK_TEMPLATE(BM_Find, StdMap)->Range(1 << 10, 1 << 18);
BENCHMARK_TEMPLATE(BM_Find, AbslMap)->Range(1 << 10, 1 << 18);

BENCHMARK_TEMPLATE(BM_EraseInsert, wavl_map)->Range(1 << 10, 1 << 18);
BENCHMARK_TEMPLATE(BM_EraseInsert, StdMap)->Range(1 << 10, 1 << 18);
BENCHMARK_TEMPLATE(BM_EraseInsert, AbslMap)->Range(1 << 10, 1 << 18);

BENCHMARK_TEMPLATE(BM_Select, wavl_map)->Range(1 << 10, 1 << 16);
BENCHMARK_TEMPLATE(BM_Select, StdMap)->Range(1 << 10, 1 << 16);

BENCHMARK_MAIN();
