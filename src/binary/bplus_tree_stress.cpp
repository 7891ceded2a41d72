// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <chrono>
#include <cstdint>
#include <iostream>
#include <leafchain/bplus_tree_map.hpp>
#include <limits>
#include <lyra/lyra.hpp>
#include <map>
#include <print>
#include <random>

int main(int argc, char** argv) {
  bool show_help = false;
  uint64_t seed = std::chrono::system_clock::now().time_since_epoch().count();
  size_t target_iterations = 100;
  size_t min_keys = 1000;
  size_t max_keys = 200000;
  size_t order = 0;
  size_t verify_every = 10000;

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
      lyra::opt(order, "order")["-o"]["--order"](
          "Tree order (0 picks a random order in [3, 64] per iteration)") |
      lyra::opt(verify_every, "puts")["-v"]["--verify-every"](
          "Run a full structural check after this many puts (0 disables)");

  // Parse command line
  auto result = cli.parse({argc, argv});
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
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

  constexpr size_t min_order = leafchain::bplus_tree_map<int, int>::min_order;
  if (order != 0 && order < min_order) {
    std::cerr << "--order must be 0 or at least " << min_order << std::endl;
    return 1;
  }

  std::uniform_int_distribution<size_t> num_key_dist(min_keys, max_keys);
  std::uniform_int_distribution<size_t> order_dist(min_order, 64);

  for (size_t iter = 0; iter < target_iterations; ++iter) {
    std::mt19937 rng(iter + seed);
    std::uniform_int_distribution<int> dist(std::numeric_limits<int>::min(),
                                            std::numeric_limits<int>::max());

    const size_t num_keys = num_key_dist(rng);
    const size_t iteration_order = order != 0 ? order : order_dist(rng);
    std::println("Iteration {} using {} keys, order {}, seed {}", iter,
                 num_keys, iteration_order, iter + seed);

    std::map<int, int> ordered_map;
    leafchain::bplus_tree_map<int, int> tree(iteration_order);

    auto validate = [&]() -> bool {
      try {
        tree.verify();
      } catch (const leafchain::invariant_violation& e) {
        std::println("Invariant violated: {}", e.what());
        return false;
      }

      if (tree.size() != ordered_map.size()) {
        std::println("Size mismatch: tree {} != map {}", tree.size(),
                     ordered_map.size());
        return false;
      }

      auto it = ordered_map.begin();
      auto tree_it = tree.begin();
      while (it != ordered_map.end() && tree_it != tree.end()) {
        if (it->first != tree_it->first || it->second != tree_it->second) {
          std::println("Mismatch at key {} != {} or val {} != {}", it->first,
                       tree_it->first, it->second, tree_it->second);
          return false;
        }
        ++it;
        ++tree_it;
      }

      if (it != ordered_map.end()) {
        std::println("B+ tree ended early!");
        return false;
      }
      if (tree_it != tree.end()) {
        std::println("Ordered map ended early!");
        return false;
      }
      return true;
    };

    size_t puts = 0;
    while (ordered_map.size() < num_keys) {
      const int key = dist(rng);
      const int val = dist(rng);
      ordered_map[key] = val;
      tree.put(key, val);
      ++puts;

      if (verify_every != 0 && puts % verify_every == 0 && !validate()) {
        return 1;
      }
    }

    // Overwrite a sample of existing keys; none of these may change the shape
    const auto height = tree.height();
    for (auto it = ordered_map.begin(); it != ordered_map.end(); ++it) {
      if (dist(rng) % 8 == 0) {
        it->second = dist(rng);
        tree.put(it->first, it->second);
      }
    }
    if (tree.height() != height) {
      std::println("Overwrite changed tree height from {} to {}", height,
                   tree.height());
      return 1;
    }

    if (!validate()) {
      return 1;
    }

    const auto stats = tree.stats();
    std::println("  height {}, {} leaves, {} inner nodes", stats.height,
                 stats.leaves, stats.inner_nodes);
  }
  return 0;
}
