// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <lyra/lyra.hpp>
#include <map>
#include <random>
#include <string>
#include <unordered_set>
#include <vector>
#include <wavl_containers/wavl_tree.hpp>

using namespace kressler::wavl_containers;

int main(int argc, char** argv) {
  bool show_help = false;
  uint64_t seed = std::chrono::system_clock::now().time_since_epoch().count();
  size_t target_iterations = 100;
  size_t min_keys = 10000;
  size_t max_keys = 200000;
  size_t batches = 100;
  size_t batch_size = 1000;
  std::string pattern = "random";

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(seed, "seed")["-d"]["--seed"](
          "Random seed (defaults to time since epoch)") |
      lyra::opt(target_iterations,
                "iterations")["-i"]["--iterations"]("Iterations to run") |
      lyra::opt(min_keys,
                "min_keys")["--min-keys"]("Minimum keys to target in tree") |
      lyra::opt(max_keys,
                "max_keys")["--max-keys"]("Maximum keys to target in tree") |
      lyra::opt(batches, "batches")["-b"]["--batches"](
          "Number of erase/insert batches to run") |
      lyra::opt(batch_size, "batch_size")["-s"]["--batch-size"](
          "Size of an erase/insert batch") |
      lyra::opt(pattern, "pattern")["-p"]["--pattern"](
          "Key order for the initial fill")
          .choices("random", "ascending", "descending");

  // Parse command line
  auto result = cli.parse({argc, argv});
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    std::cerr << cli << std::endl;
    return 1;
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  if (min_keys > max_keys) {
    std::cerr << "--min-keys must not exceed --max-keys" << std::endl;
    return 1;
  }

  std::uniform_int_distribution<size_t> num_key_dist(min_keys, max_keys);
  for (size_t iter = 0; iter < target_iterations; ++iter) {
    std::mt19937 rng(iter + seed);
    std::uniform_int_distribution<int> dist(std::numeric_limits<int>::min(),
                                            std::numeric_limits<int>::max());

    size_t num_keys = num_key_dist(rng);
    std::cout << "Iteration " << iter << " using " << num_keys << " keys, seed "
              << iter + seed << std::endl;

    std::map<int, std::string> ordered_map;
    wavl_map tree;
    std::vector<int> live_keys;
    std::unordered_set<int> seen;
    size_t insert_operations = 0;
    size_t erase_operations = 0;

    auto insert_key = [&](int key) -> void {
      const std::string value = std::to_string(key);
      const bool expected = ordered_map.insert({key, value}).second;
      const auto count = tree.insert(key, value);
      if (count.has_value() != expected) {
        std::cout << "Insert of key " << key << " disagrees with std::map"
                  << std::endl;
        exit(1);
      }
      if (count) {
        insert_operations += *count;
        live_keys.push_back(key);
        seen.insert(key);
      }
    };

    auto remove = [&]() -> void {
      std::uniform_int_distribution<size_t> pick(0, live_keys.size() - 1);
      const size_t index = pick(rng);
      const int key = live_keys[index];
      live_keys[index] = live_keys.back();
      live_keys.pop_back();
      seen.erase(key);
      ordered_map.erase(key);

      const auto count = tree.erase(key);
      if (!count) {
        std::cout << "Erase of present key " << key << " failed" << std::endl;
        exit(1);
      }
      erase_operations += *count;
    };

    auto validate = [&]() -> void {
      std::string diagnostic;
      if (!tree.validate_invariants(&diagnostic)) {
        std::cout << "Invariant violated: " << diagnostic << std::endl;
        exit(1);
      }

      auto it = ordered_map.begin();
      auto tree_it = tree.begin();

      while (it != ordered_map.end() && tree_it != tree.end()) {
        if (it->first != tree_it->first || it->second != tree_it->second) {
          std::cout << "Mismatch at key " << it->first
                    << " != " << tree_it->first << std::endl;
          exit(1);
        }
        ++it;
        ++tree_it;
      }

      if (it != ordered_map.end()) {
        std::cout << "WAVL tree ended early!" << std::endl;
        exit(1);
      }

      if (tree_it != tree.end()) {
        std::cout << "Ordered map ended early!" << std::endl;
        exit(1);
      }
    };

    // Build up the initial tree/map
    if (pattern == "ascending") {
      for (size_t i = 0; i < num_keys; ++i) {
        insert_key(static_cast<int>(i));
      }
    } else if (pattern == "descending") {
      for (size_t i = num_keys; i > 0; --i) {
        insert_key(static_cast<int>(i));
      }
    } else {
      while (ordered_map.size() < num_keys) {
        insert_key(dist(rng));
      }
    }
    validate();
    std::cout << "  filled: height " << tree.height() << ", rank "
              << tree.rank() << ", " << insert_operations
              << " rebalancing operations" << std::endl;

    // Run erase/insert batches
    for (size_t batch = 0; batch < batches; ++batch) {
      for (size_t i = 0; i < batch_size && !live_keys.empty(); ++i) {
        remove();
      }
      for (size_t i = 0; i < batch_size; ++i) {
        int key = dist(rng);
        while (seen.contains(key)) {
          key = dist(rng);
        }
        insert_key(key);
      }
      validate();
    }

    // Empty out the tree/map
    while (!live_keys.empty()) {
      remove();
    }
    validate();
    if (!tree.empty()) {
      std::cout << "Tree not empty after erasing every key" << std::endl;
      exit(1);
    }

    std::cout << "  done: " << insert_operations << " insert and "
              << erase_operations << " erase rebalancing operations"
              << std::endl;
  }
  return 0;
}
