// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <functional>
#include <iterator>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <wavl_containers/wavl_tree.hpp>

using namespace kressler::wavl_containers;

namespace {

template <typename Tree>
void require_valid(const Tree& tree) {
  std::string diagnostic;
  const bool valid = tree.validate_invariants(&diagnostic);
  INFO(diagnostic);
  REQUIRE(valid);
}

// Helper function to populate tree with data using insert()
template <typename Tree>
void populate_tree(Tree& tree,
                   std::vector<std::pair<int, std::string>> data) {
  for (const auto& [key, value] : data) {
    REQUIRE(tree.insert(key, value).has_value());
  }
}

}  // namespace

TEMPLATE_TEST_CASE("wavl_tree default constructor creates empty tree",
                   "[wavl][constructor]", int, std::int64_t) {
  wavl_tree<TestType, std::string> tree;
  REQUIRE(tree.empty());
  REQUIRE(tree.size() == 0);
  REQUIRE(tree.begin() == tree.end());
  require_valid(tree);
}

TEST_CASE("wavl_tree queries on an empty tree", "[wavl][empty]") {
  wavl_map tree;

  REQUIRE_FALSE(tree.search(1).has_value());
  REQUIRE_FALSE(tree.min().has_value());
  REQUIRE_FALSE(tree.max().has_value());
  REQUIRE_FALSE(tree.select(1).has_value());
  REQUIRE(tree.keys_to_array().empty());
  REQUIRE(tree.values_to_array().empty());
  REQUIRE(tree.rank() == -1);
  REQUIRE(tree.height() == -1);
  REQUIRE(tree.find(1) == tree.end());
  REQUIRE_FALSE(tree.contains(1));
  REQUIRE(tree.count(1) == 0);
  REQUIRE(tree.rbegin() == tree.rend());
}

TEST_CASE("wavl_tree three element tree", "[wavl][insert]") {
  wavl_map tree;
  REQUIRE(tree.insert(5, "a") == 0);
  REQUIRE(tree.insert(3, "b") == 1);
  REQUIRE(tree.insert(8, "c") == 0);

  REQUIRE(tree.keys_to_array() == std::vector<int>{3, 5, 8});
  REQUIRE(tree.values_to_array() == std::vector<std::string>{"b", "a", "c"});
  REQUIRE(tree.min() == "b");
  REQUIRE(tree.max() == "c");
  REQUIRE(tree.size() == 3);
  REQUIRE_FALSE(tree.empty());
  REQUIRE(tree.height() == 1);
  REQUIRE(tree.rank() == 1);
  require_valid(tree);
}

TEST_CASE("wavl_tree search", "[wavl][search]") {
  wavl_map tree;
  populate_tree(tree, {{10, "ten"}, {20, "twenty"}, {5, "five"},
                       {15, "fifteen"}, {25, "twenty-five"}});

  SECTION("Existing keys") {
    REQUIRE(tree.search(10) == "ten");
    REQUIRE(tree.search(5) == "five");
    REQUIRE(tree.search(25) == "twenty-five");
    REQUIRE(tree.search(15) == "fifteen");
  }

  SECTION("Missing keys") {
    REQUIRE_FALSE(tree.search(0).has_value());
    REQUIRE_FALSE(tree.search(12).has_value());
    REQUIRE_FALSE(tree.search(30).has_value());
  }

  SECTION("Negative keys") {
    REQUIRE(tree.insert(-7, "minus seven").has_value());
    REQUIRE(tree.search(-7) == "minus seven");
    REQUIRE(tree.min() == "minus seven");
  }
}

TEST_CASE("wavl_tree duplicate insert", "[wavl][insert][error]") {
  wavl_map tree;
  REQUIRE(tree.insert(5, "a") == 0);

  const auto result = tree.insert(5, "z");
  REQUIRE_FALSE(result.has_value());
  REQUIRE(tree.search(5) == "a");
  REQUIRE(tree.size() == 1);
  require_valid(tree);
}

TEST_CASE("wavl_tree erase", "[wavl][erase]") {
  SECTION("Missing key leaves tree unchanged") {
    wavl_map tree;
    populate_tree(tree, {{5, "a"}, {3, "b"}, {8, "c"}});

    REQUIRE_FALSE(tree.erase(99).has_value());
    REQUIRE(tree.size() == 3);
    REQUIRE(tree.keys_to_array() == std::vector<int>{3, 5, 8});
    REQUIRE(tree.min() == "b");
    REQUIRE(tree.max() == "c");
    require_valid(tree);
  }

  SECTION("Erase from empty tree") {
    wavl_map tree;
    REQUIRE_FALSE(tree.erase(1).has_value());
    REQUIRE(tree.empty());
  }

  SECTION("Erase the root of a three node tree") {
    wavl_map tree;
    populate_tree(tree, {{5, "a"}, {3, "b"}, {8, "c"}});

    REQUIRE(tree.erase(5).has_value());
    REQUIRE(tree.size() == 2);
    REQUIRE(tree.keys_to_array() == std::vector<int>{3, 8});
    REQUIRE(tree.min() == "b");
    REQUIRE(tree.max() == "c");
    REQUIRE_FALSE(tree.search(5).has_value());
    require_valid(tree);
  }

  SECTION("Erase the only element") {
    wavl_map tree;
    REQUIRE(tree.insert(1, "one") == 0);
    REQUIRE(tree.erase(1) == 0);
    REQUIRE(tree.empty());
    REQUIRE_FALSE(tree.min().has_value());
    REQUIRE_FALSE(tree.max().has_value());
    REQUIRE(tree.begin() == tree.end());
    require_valid(tree);
  }

  SECTION("Erasing the minimum and maximum moves the caches") {
    wavl_map tree;
    populate_tree(tree, {{1, "one"}, {2, "two"}, {3, "three"}, {4, "four"}});

    REQUIRE(tree.erase(1).has_value());
    REQUIRE(tree.min() == "two");
    REQUIRE(tree.erase(4).has_value());
    REQUIRE(tree.max() == "three");
    require_valid(tree);
  }

  SECTION("Erase a key twice") {
    wavl_map tree;
    populate_tree(tree, {{1, "one"}, {2, "two"}});
    REQUIRE(tree.erase(2).has_value());
    REQUIRE_FALSE(tree.erase(2).has_value());
    REQUIRE(tree.size() == 1);
  }
}

TEST_CASE("wavl_tree select", "[wavl][select]") {
  wavl_map tree;
  populate_tree(tree, {{5, "a"}, {3, "b"}, {8, "c"}});

  SECTION("Ranks map to ascending keys") {
    REQUIRE(tree.select(1) == "b");
    REQUIRE(tree.select(2) == "a");
    REQUIRE(tree.select(3) == "c");
  }

  SECTION("Out of range ranks") {
    REQUIRE_FALSE(tree.select(0).has_value());
    REQUIRE_FALSE(tree.select(4).has_value());
    REQUIRE_FALSE(tree.select(1000).has_value());
  }

  SECTION("select agrees with values_to_array") {
    for (int k = 10; k < 60; ++k) {
      REQUIRE(tree.insert(k, std::to_string(k)).has_value());
    }
    const auto values = tree.values_to_array();
    REQUIRE(values.size() == tree.size());
    for (std::size_t i = 1; i <= tree.size(); ++i) {
      REQUIRE(tree.select(i) == values[i - 1]);
    }
  }
}

TEST_CASE("wavl_tree find, contains, count and at", "[wavl][find]") {
  wavl_map tree;
  populate_tree(tree, {{1, "one"}, {3, "three"}, {5, "five"}});

  SECTION("find") {
    auto it = tree.find(3);
    REQUIRE(it != tree.end());
    REQUIRE(it->first == 3);
    REQUIRE(it->second == "three");
    REQUIRE(tree.find(2) == tree.end());
  }

  SECTION("contains and count") {
    REQUIRE(tree.contains(1));
    REQUIRE_FALSE(tree.contains(2));
    REQUIRE(tree.count(5) == 1);
    REQUIRE(tree.count(6) == 0);
  }

  SECTION("at") {
    REQUIRE(tree.at(5) == "five");
    tree.at(5) = "FIVE";
    REQUIRE(tree.search(5) == "FIVE");

    const wavl_map& const_tree = tree;
    REQUIRE(const_tree.at(1) == "one");
    REQUIRE_THROWS_AS(tree.at(2), std::out_of_range);
    REQUIRE_THROWS_AS(const_tree.at(2), std::out_of_range);
  }
}

TEST_CASE("wavl_tree insert_or_assign", "[wavl][insert_or_assign]") {
  wavl_map tree;
  populate_tree(tree, {{1, "one"}, {2, "two"}});

  SECTION("Assigns to an existing key") {
    const int height_before = tree.height();
    auto [it, inserted] = tree.insert_or_assign(1, "uno");
    REQUIRE_FALSE(inserted);
    REQUIRE(it->first == 1);
    REQUIRE(it->second == "uno");
    REQUIRE(tree.search(1) == "uno");
    REQUIRE(tree.size() == 2);
    REQUIRE(tree.height() == height_before);
  }

  SECTION("Inserts a new key") {
    auto [it, inserted] = tree.insert_or_assign(3, std::string("three"));
    REQUIRE(inserted);
    REQUIRE(it->first == 3);
    REQUIRE(tree.size() == 3);
    REQUIRE(tree.max() == "three");
    require_valid(tree);
  }
}

TEST_CASE("wavl_tree iterators", "[wavl][iterator]") {
  wavl_map tree;
  populate_tree(tree,
                {{4, "d"}, {2, "b"}, {6, "f"}, {1, "a"}, {3, "c"}, {5, "e"}});

  SECTION("Forward iteration is ordered") {
    std::vector<int> keys;
    for (auto it = tree.begin(); it != tree.end(); ++it) {
      keys.push_back(it->first);
    }
    REQUIRE(keys == std::vector<int>{1, 2, 3, 4, 5, 6});
  }

  SECTION("Range-based for over a const tree") {
    const wavl_map& const_tree = tree;
    std::string joined;
    for (const auto& entry : const_tree) {
      joined += entry.second;
    }
    REQUIRE(joined == "abcdef");
  }

  SECTION("Reverse iteration") {
    std::vector<int> keys;
    for (auto it = tree.rbegin(); it != tree.rend(); ++it) {
      keys.push_back(it->first);
    }
    REQUIRE(keys == std::vector<int>{6, 5, 4, 3, 2, 1});
  }

  SECTION("Decrementing end reaches the maximum") {
    auto it = tree.end();
    --it;
    REQUIRE(it->first == 6);
    it--;
    REQUIRE(it->first == 5);
  }

  SECTION("Post-increment returns the old position") {
    auto it = tree.begin();
    auto old = it++;
    REQUIRE(old->first == 1);
    REQUIRE(it->first == 2);
  }

  SECTION("Values can be modified through iterators") {
    for (auto it = tree.begin(); it != tree.end(); ++it) {
      it->second += it->second;
    }
    REQUIRE(tree.search(3) == "cc");
    REQUIRE(tree.min() == "aa");
  }

  SECTION("Iterator converts to const_iterator") {
    wavl_map::const_iterator it = tree.find(2);
    REQUIRE(it != tree.cend());
    REQUIRE((*it).second == "b");
    std::pair<int, std::string> copy = *it;
    REQUIRE(copy.first == 2);
  }

  SECTION("Distance matches size") {
    REQUIRE(static_cast<std::size_t>(std::distance(tree.begin(),
                                                   tree.end())) ==
            tree.size());
  }
}

TEST_CASE("wavl_tree iterator-based erase", "[wavl][erase][iterator]") {
  wavl_map tree;
  for (int k = 1; k <= 20; ++k) {
    REQUIRE(tree.insert(k, std::to_string(k)).has_value());
  }

  SECTION("Returns the following element") {
    // Key 8 is an inner node with two children in this tree
    auto next = tree.erase(tree.find(8));
    REQUIRE(next != tree.end());
    REQUIRE(next->first == 9);

    next = tree.erase(tree.find(20));
    REQUIRE(next == tree.end());
    require_valid(tree);
  }

  SECTION("Erase every other element while iterating") {
    auto it = tree.begin();
    while (it != tree.end()) {
      if (it->first % 2 == 0) {
        it = tree.erase(it);
      } else {
        ++it;
      }
    }
    REQUIRE(tree.size() == 10);
    REQUIRE(tree.keys_to_array() ==
            std::vector<int>{1, 3, 5, 7, 9, 11, 13, 15, 17, 19});
    require_valid(tree);
  }

  SECTION("Erase everything from the front") {
    auto it = tree.begin();
    while (it != tree.end()) {
      it = tree.erase(it);
      require_valid(tree);
    }
    REQUIRE(tree.empty());
  }
}

TEST_CASE("wavl_tree clear", "[wavl][clear]") {
  wavl_map tree;
  for (int k = 0; k < 100; ++k) {
    REQUIRE(tree.insert(k, "v").has_value());
  }
  tree.clear();
  REQUIRE(tree.empty());
  REQUIRE(tree.size() == 0);
  REQUIRE_FALSE(tree.min().has_value());
  require_valid(tree);

  // Tree remains usable
  REQUIRE(tree.insert(7, "seven") == 0);
  REQUIRE(tree.min() == "seven");
  REQUIRE(tree.max() == "seven");
}

TEST_CASE("wavl_tree copy", "[wavl][copy]") {
  wavl_map original;
  for (int k = 0; k < 50; ++k) {
    REQUIRE(original.insert(k * 3, std::to_string(k)).has_value());
  }

  SECTION("Copy constructor produces an independent tree") {
    wavl_map copy(original);
    REQUIRE(copy.keys_to_array() == original.keys_to_array());
    REQUIRE(copy.values_to_array() == original.values_to_array());
    REQUIRE(copy.height() == original.height());
    REQUIRE(copy.rank() == original.rank());
    require_valid(copy);

    REQUIRE(copy.erase(0).has_value());
    REQUIRE(original.contains(0));
    REQUIRE(original.size() == 50);
    REQUIRE(copy.size() == 49);
  }

  SECTION("Copies rebalance exactly like the original") {
    wavl_map copy(original);
    for (int k = 0; k < 50; k += 2) {
      REQUIRE(copy.erase(k * 3) == original.erase(k * 3));
    }
    for (int k = 1000; k < 1020; ++k) {
      REQUIRE(copy.insert(k, "x") == original.insert(k, "x"));
    }
  }

  SECTION("Copy assignment replaces contents") {
    wavl_map target;
    populate_tree(target, {{-1, "gone"}});
    target = original;
    REQUIRE_FALSE(target.contains(-1));
    REQUIRE(target.size() == original.size());
    REQUIRE(target.min() == original.min());
    require_valid(target);
  }

  SECTION("Copy of an empty tree") {
    wavl_map empty_tree;
    wavl_map copy(empty_tree);
    REQUIRE(copy.empty());
    require_valid(copy);
  }
}

TEST_CASE("wavl_tree move and swap", "[wavl][move][swap]") {
  wavl_map source;
  populate_tree(source, {{1, "one"}, {2, "two"}, {3, "three"}});

  SECTION("Move constructor") {
    wavl_map moved(std::move(source));
    REQUIRE(moved.size() == 3);
    REQUIRE(moved.min() == "one");
    REQUIRE(source.empty());  // NOLINT(bugprone-use-after-move)
    require_valid(moved);
    require_valid(source);
  }

  SECTION("Move assignment") {
    wavl_map target;
    populate_tree(target, {{10, "ten"}});
    target = std::move(source);
    REQUIRE(target.keys_to_array() == std::vector<int>{1, 2, 3});
    REQUIRE(source.empty());  // NOLINT(bugprone-use-after-move)
    require_valid(target);
  }

  SECTION("swap") {
    wavl_map other;
    populate_tree(other, {{10, "ten"}});
    source.swap(other);
    REQUIRE(source.keys_to_array() == std::vector<int>{10});
    REQUIRE(other.keys_to_array() == std::vector<int>{1, 2, 3});
    REQUIRE(source.max() == "ten");
    REQUIRE(other.max() == "three");
  }
}

TEST_CASE("wavl_tree initializer_list and range constructors",
          "[wavl][constructor]") {
  SECTION("Initializer list keeps the first duplicate") {
    wavl_map tree = {{3, "c"}, {1, "a"}, {2, "b"}, {1, "ignored"}};
    REQUIRE(tree.size() == 3);
    REQUIRE(tree.search(1) == "a");
    require_valid(tree);
  }

  SECTION("Range constructor from std::map") {
    std::map<int, std::string> source{{5, "e"}, {4, "d"}, {9, "i"}};
    wavl_map tree(source.begin(), source.end());
    REQUIRE(tree.keys_to_array() == std::vector<int>{4, 5, 9});
    REQUIRE(tree.values_to_array() == std::vector<std::string>{"d", "e", "i"});
  }
}

TEST_CASE("wavl_tree with std::greater (descending order)",
          "[wavl][comparator]") {
  wavl_tree<int, std::string, std::greater<int>> tree;
  for (int k = 1; k <= 10; ++k) {
    REQUIRE(tree.insert(k, std::to_string(k)).has_value());
  }
  require_valid(tree);

  REQUIRE(tree.keys_to_array() ==
          std::vector<int>{10, 9, 8, 7, 6, 5, 4, 3, 2, 1});
  REQUIRE(tree.min() == "10");
  REQUIRE(tree.max() == "1");
  REQUIRE(tree.select(1) == "10");
  REQUIRE(tree.begin()->first == 10);
}

TEST_CASE("wavl_tree with string keys", "[wavl][keys]") {
  wavl_tree<std::string, int> tree;
  REQUIRE(tree.insert("pear", 3).has_value());
  REQUIRE(tree.insert("apple", 1).has_value());
  REQUIRE(tree.insert("fig", 2).has_value());
  REQUIRE_FALSE(tree.insert("fig", 9).has_value());

  REQUIRE(tree.keys_to_array() ==
          std::vector<std::string>{"apple", "fig", "pear"});
  REQUIRE(tree.values_to_array() == std::vector<int>{1, 2, 3});
  REQUIRE(tree.erase("apple").has_value());
  REQUIRE(tree.min() == 2);
  require_valid(tree);
}
