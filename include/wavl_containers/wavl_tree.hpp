// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cassert>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace kressler::wavl_containers {

// Concept to check if a comparator is compatible with a key type
template <typename Key, typename Compare>
concept ComparatorCompatible = requires(Compare comp, Key a, Key b) {
  { comp(a, b) } -> std::convertible_to<bool>;
} && std::is_default_constructible_v<Compare>;

/**
 * Rebalancing cost reported by wavl_tree::insert() and wavl_tree::erase().
 *
 * Each repair step adds a fixed amount to the returned count. The values are
 * an accounting convention: a double rotation counts 5 even though it
 * performs two rotations.
 */
struct rebalance_cost {
  static constexpr std::size_t promote = 1;
  static constexpr std::size_t insert_rotate = 2;
  static constexpr std::size_t insert_double_rotate = 5;
  static constexpr std::size_t demote = 1;
  static constexpr std::size_t double_demote = 2;
  // A delete rotation that leaves a 2,2 node adds one demote on top
  static constexpr std::size_t erase_rotate = 3;
  static constexpr std::size_t erase_double_rotate = 5;
};

/**
 * Repair step selected while walking up after an insertion.
 */
enum class InsertCase : std::uint8_t {
  Promote,       // 0,1 node: raise rank, continue at the parent
  Rotate,        // 0,2 node, child's inner diff is 2
  DoubleRotate,  // 0,2 node, child's outer diff is 2
  Stop,          // node is valid
};

/**
 * Repair step selected while walking up after an erasure.
 */
enum class EraseCase : std::uint8_t {
  Demote,        // 3,2 node or 2,2 leaf
  DoubleDemote,  // 3,1 node whose 1-side child is 2,2
  Rotate,        // 3,1 node, child's outer diff is 1
  DoubleRotate,  // 3,1 node, child's outer diff is 2
  Stop,          // node is valid
};

/**
 * An ordered map backed by a weak AVL (WAVL) tree.
 *
 * Every node stores the rank difference to each of its children instead of a
 * rank or height. Differences are always 1 or 2 and a missing child has rank
 * -1, so leaves are 1,1 nodes of rank 0. Insertion repairs with promotions
 * and at most one (single or double) rotation; erasure repairs with demotions
 * and at most one rotation. The height stays below 2 * log2(n + 1), and below
 * ~1.44 * log2(n + 1) when no erasures have happened.
 *
 * Each node also caches the size of its subtree, giving O(log n) select().
 * The smallest and largest nodes are cached for O(1) min(), max() and
 * begin().
 *
 * insert() and erase() report the number of rebalancing operations performed
 * (see rebalance_cost), or std::nullopt when the key already exists or is
 * missing. A failing call does not modify the tree.
 *
 * @tparam Key The key type (must be ComparatorCompatible with Compare)
 * @tparam Value The mapped type
 * @tparam Compare The comparison function object type (defaults to
 *         std::less<Key>)
 * @tparam Allocator The allocator type, rebound internally to the node type
 *
 * Example:
 * @code
 * wavl_map tree;
 * tree.insert(5, "a");
 * tree.insert(3, "b");
 * tree.select(1);  // "b"
 * @endcode
 */
template <typename Key, typename Value, typename Compare = std::less<Key>,
          typename Allocator = std::allocator<std::pair<const Key, Value>>>
  requires ComparatorCompatible<Key, Compare>
class wavl_tree {
 public:
  // Type aliases
  using key_type = Key;
  using mapped_type = Value;
  using value_type = std::pair<const Key, Value>;
  using size_type = std::size_t;
  using difference_type = std::ptrdiff_t;
  using allocator_type = Allocator;
  using key_compare = Compare;

 private:
  /**
   * Internal tree node. A null child pointer is the absent child: rank -1,
   * subtree size 0.
   */
  struct node {
    Key key;
    Value value;
    node* left;
    node* right;
    node* parent;  // Non-owning, nullptr for the root
    std::uint8_t left_diff;
    std::uint8_t right_diff;
    size_type subtree_size;

    template <typename K, typename V>
    node(K&& k, V&& v, node* p)
        : key(std::forward<K>(k)),
          value(std::forward<V>(v)),
          left(nullptr),
          right(nullptr),
          parent(p),
          left_diff(1),
          right_diff(1),
          subtree_size(1) {}
  };

 public:
  /**
   * Proxy for key-value pairs returned by iterators.
   * Nodes store key and value separately, so there is no std::pair to point
   * at.
   */
  template <bool IsConst>
  class pair_proxy {
   public:
    // Key is always const to prevent breaking sorted order invariant
    using key_ref_type = const Key&;
    using value_ref_type = std::conditional_t<IsConst, const Value&, Value&>;

    pair_proxy(key_ref_type k, value_ref_type v) : first(k), second(v) {}

    // Allow conversion to std::pair for compatibility
    operator std::pair<Key, Value>() const { return {first, second}; }

    key_ref_type first;
    value_ref_type second;
  };

  /**
   * Bidirectional iterator over elements in ascending key order.
   * Walks parent links, so increment is amortized O(1).
   */
  template <bool IsConst>
  class tree_iterator {
   public:
    struct arrow_proxy {
      pair_proxy<IsConst> ref;
      arrow_proxy(pair_proxy<IsConst> r) : ref(r) {}
      pair_proxy<IsConst>* operator->() { return &ref; }
    };

    using iterator_category = std::bidirectional_iterator_tag;
    using value_type = std::pair<Key, Value>;
    using difference_type = std::ptrdiff_t;
    using pointer = arrow_proxy;  // This is what operator-> actually returns
    using reference = pair_proxy<IsConst>;

    tree_iterator() : node_(nullptr), tree_(nullptr) {}

    // Allow conversion from non-const to const iterator
    template <bool WasConst = IsConst, typename = std::enable_if_t<WasConst>>
    tree_iterator(const tree_iterator<false>& other)
        : node_(other.node_), tree_(other.tree_) {}

    reference operator*() const {
      assert(node_ != nullptr && "Dereferencing end iterator");
      return reference(node_->key, node_->value);
    }

    arrow_proxy operator->() const { return arrow_proxy(operator*()); }

    tree_iterator& operator++() {
      assert(node_ != nullptr && "Incrementing end iterator");
      node_ = wavl_tree::successor(node_);
      return *this;
    }

    tree_iterator operator++(int) {
      tree_iterator tmp = *this;
      ++(*this);
      return tmp;
    }

    tree_iterator& operator--() {
      if (node_ == nullptr) {
        // Decrementing end() lands on the largest element
        assert(tree_ != nullptr &&
               "Cannot decrement default-constructed iterator");
        node_ = tree_->max_;
        assert(node_ != nullptr && "Decrementing begin() of empty tree");
        return *this;
      }
      node_ = wavl_tree::predecessor(node_);
      assert(node_ != nullptr && "Decrementing past begin()");
      return *this;
    }

    tree_iterator operator--(int) {
      tree_iterator tmp = *this;
      --(*this);
      return tmp;
    }

    bool operator==(const tree_iterator& other) const {
      return node_ == other.node_;
    }

    bool operator!=(const tree_iterator& other) const {
      return !(*this == other);
    }

   private:
    friend class wavl_tree;
    template <bool>
    friend class tree_iterator;

    tree_iterator(node* n, const wavl_tree* tree) : node_(n), tree_(tree) {}

    node* node_;
    const wavl_tree* tree_;
  };

  using iterator = tree_iterator<false>;
  using const_iterator = tree_iterator<true>;
  using reverse_iterator = std::reverse_iterator<iterator>;
  using const_reverse_iterator = std::reverse_iterator<const_iterator>;

  /**
   * Default constructor - creates an empty tree.
   *
   * @param alloc Allocator to use for node allocation
   */
  explicit wavl_tree(const Allocator& alloc = Allocator());

  /**
   * Destructor - deallocates all nodes.
   */
  ~wavl_tree();

  /**
   * Copy constructor - clones the other tree node by node.
   * The copy has the same shape and rank differences as the original, so
   * subsequent operations report the same rebalancing counts on both.
   *
   * Complexity: O(m) where m = other.size()
   */
  wavl_tree(const wavl_tree& other);

  /**
   * Copy assignment operator - replaces contents with a clone of other.
   * Complexity: O(n + m)
   */
  wavl_tree& operator=(const wavl_tree& other);

  /**
   * Move constructor - takes ownership of another tree's nodes.
   * Leaves other empty.
   * Complexity: O(1)
   */
  wavl_tree(wavl_tree&& other) noexcept;

  /**
   * Move assignment operator - replaces contents by taking ownership.
   * Leaves other empty.
   * Complexity: O(n) where n is this tree's size (due to deallocation)
   */
  wavl_tree& operator=(wavl_tree&& other) noexcept;

  /**
   * Constructs the tree from an initializer list.
   * Later duplicates of a key are ignored.
   * Complexity: O(n log n)
   */
  wavl_tree(std::initializer_list<value_type> init,
            const Allocator& alloc = Allocator());

  /**
   * Constructs the tree from a range of key-value pairs.
   * Complexity: O(n log n)
   */
  template <typename InputIt>
  wavl_tree(InputIt first, InputIt last, const Allocator& alloc = Allocator());

  /**
   * Returns the number of elements in the tree.
   * Complexity: O(1)
   */
  [[nodiscard]] size_type size() const { return size_of(root_); }

  /**
   * Returns true if the tree is empty.
   * Complexity: O(1)
   */
  [[nodiscard]] bool empty() const { return root_ == nullptr; }

  key_compare key_comp() const { return key_compare(); }

  allocator_type get_allocator() const { return allocator_type(node_alloc_); }

  /**
   * Iterators in ascending key order.
   * begin() is O(1) through the cached minimum.
   */
  iterator begin() { return iterator(min_, this); }
  iterator end() { return iterator(nullptr, this); }
  const_iterator begin() const { return const_iterator(min_, this); }
  const_iterator end() const { return const_iterator(nullptr, this); }
  const_iterator cbegin() const { return begin(); }
  const_iterator cend() const { return end(); }

  reverse_iterator rbegin() { return reverse_iterator(end()); }
  reverse_iterator rend() { return reverse_iterator(begin()); }
  const_reverse_iterator rbegin() const {
    return const_reverse_iterator(end());
  }
  const_reverse_iterator rend() const {
    return const_reverse_iterator(begin());
  }
  const_reverse_iterator crbegin() const { return rbegin(); }
  const_reverse_iterator crend() const { return rend(); }

  /**
   * Returns a copy of the value stored under key, or std::nullopt if the key
   * is not present.
   * Complexity: O(log n)
   */
  std::optional<Value> search(const Key& key) const;

  /**
   * Finds an element with the given key.
   * Returns an iterator to the element if found, end() otherwise.
   * Complexity: O(log n)
   */
  iterator find(const Key& key);
  const_iterator find(const Key& key) const;

  /**
   * Returns a reference to the value associated with the specified key.
   * Throws std::out_of_range if the key does not exist.
   *
   * Complexity: O(log n)
   */
  Value& at(const Key& key);
  const Value& at(const Key& key) const;

  bool contains(const Key& key) const { return find_node(key) != nullptr; }

  size_type count(const Key& key) const { return contains(key) ? 1 : 0; }

  /**
   * Inserts a key-value pair as a new leaf and rebalances.
   *
   * Returns the number of rebalancing operations performed (0 if the new leaf
   * needed no repair), or std::nullopt if the key already exists. On
   * duplicate keys the tree, including the stored value, is left unchanged.
   *
   * Complexity: O(log n), with O(1) amortized rebalancing
   */
  std::optional<size_type> insert(const Key& key, const Value& value);

  /**
   * Inserts a key-value pair.
   * Equivalent to insert(value.first, value.second).
   */
  std::optional<size_type> insert(const value_type& value) {
    return insert(value.first, value.second);
  }

  /**
   * Inserts a new element or assigns to an existing one.
   * Assignment overwrites the stored value in place and never restructures
   * the tree.
   *
   * @return Pair of iterator to inserted/updated element and bool indicating
   * insertion (true) vs assignment (false)
   *
   * Complexity: O(log n)
   */
  template <typename M>
  std::pair<iterator, bool> insert_or_assign(const Key& key, M&& value);

  /**
   * Removes the element with the given key and rebalances.
   *
   * A node with two children is not unlinked itself: it takes over its
   * in-order successor's key and value, and the successor (which has at most
   * one child) is unlinked instead.
   *
   * Returns the number of rebalancing operations performed, or std::nullopt if
   * the key was not found (the tree is then unchanged).
   *
   * Complexity: O(log n)
   */
  std::optional<size_type> erase(const Key& key);

  /**
   * Removes the element at the given iterator position.
   * Returns an iterator to the element following the erased element.
   *
   * The iterator pos must be valid and dereferenceable (not end()). Iterators
   * to the erased element and to its successor are invalidated.
   *
   * Complexity: O(log n)
   */
  iterator erase(const_iterator pos);

  /**
   * Removes all elements from the tree.
   * All iterators are invalidated.
   *
   * Complexity: O(n)
   */
  void clear();

  /**
   * Swaps the contents of this tree with another tree.
   * Complexity: O(1)
   */
  void swap(wavl_tree& other) noexcept;

  /**
   * Value of the smallest / largest key, or std::nullopt on an empty tree.
   * Complexity: O(1)
   */
  std::optional<Value> min() const;
  std::optional<Value> max() const;

  /**
   * Returns the value with the rank-th smallest key (1-indexed), or
   * std::nullopt if rank is outside [1, size()].
   * select(1) is the value of min(), select(size()) the value of max().
   *
   * Complexity: O(log n)
   */
  std::optional<Value> select(size_type rank) const;

  /**
   * All keys / values in ascending key order.
   * Uses an explicit stack rather than recursion.
   *
   * Complexity: O(n)
   */
  std::vector<Key> keys_to_array() const;
  std::vector<Value> values_to_array() const;

  /**
   * Rank of the root, or -1 if the tree is empty.
   * Complexity: O(log n)
   */
  int rank() const;

  /**
   * Number of edges on the longest root-to-leaf path, or -1 if the tree is
   * empty.
   * Complexity: O(n)
   */
  int height() const;

  /**
   * Checks every structural invariant: key order, rank differences in {1,2}
   * with consistent ranks and rank-0 leaves, cached subtree sizes, parent
   * links and the min/max caches.
   *
   * @param diagnostic If non-null, receives a description of the first
   *        violation found
   * @return true if the tree is valid
   *
   * Complexity: O(n)
   */
  bool validate_invariants(std::string* diagnostic = nullptr) const;

 private:
  using node_allocator =
      typename std::allocator_traits<Allocator>::template rebind_alloc<node>;
  using node_alloc_traits = std::allocator_traits<node_allocator>;

  /**
   * Result of one repair step: operations to add, and whether the walk
   * toward the root ends here.
   */
  struct rebalance_step {
    size_type operations;
    bool done;
  };

  /**
   * Where a key sits or would be attached.
   * match is the node holding the key, or nullptr; in that case parent and
   * as_left name the empty slot (parent is nullptr for an empty tree).
   */
  struct insert_position {
    node* match;
    node* parent;
    bool as_left;
  };

  static size_type size_of(const node* n) {
    return n == nullptr ? 0 : n->subtree_size;
  }

  static bool is_leaf(const node* n) {
    return n->left == nullptr && n->right == nullptr;
  }

  // Child slot and rank difference on one side of a node
  static node*& child_slot(node* n, bool left) {
    return left ? n->left : n->right;
  }
  static std::uint8_t& diff_slot(node* n, bool left) {
    return left ? n->left_diff : n->right_diff;
  }
  static std::uint8_t diff_of(const node* n, bool left) {
    return left ? n->left_diff : n->right_diff;
  }

  static void refresh_size(node* n) {
    n->subtree_size = size_of(n->left) + size_of(n->right) + 1;
  }

  static node* leftmost(node* n);
  static node* rightmost(node* n);
  static node* successor(node* n);
  static node* predecessor(node* n);

  template <typename K, typename V>
  node* allocate_node(K&& key, V&& value, node* parent);
  void deallocate_node(node* n);
  void deallocate_subtree(node* n);
  node* clone_subtree(const node* source, node* parent);

  node* find_node(const Key& key) const;
  insert_position find_insert_position(const Key& key) const;

  /**
   * Attaches a new leaf at pos, updates the min/max caches, rebalances and
   * refreshes subtree sizes. Returns the leaf and the rebalancing count.
   * Allocation happens before any link changes.
   */
  template <typename V>
  std::pair<node*, size_type> insert_at(const insert_position& pos,
                                        const Key& key, V&& value);

  /**
   * Physically removes n (or its successor, see erase()) and rebalances.
   * Returns the rebalancing count.
   */
  size_type erase_node(node* n);

  /**
   * Relinks child above its parent. The child's inner subtree moves to the
   * parent. Only the two nodes' subtree sizes are refreshed; rank differences
   * must be set by the caller beforehand.
   */
  void rotate_up(node* child);

  /**
   * Walks from the parent of a new leaf toward the root, applying repair
   * steps until one reports done.
   */
  size_type rebalance_after_insert(node* leaf);
  static InsertCase classify_insert(node* n, bool from_left);
  rebalance_step apply_insert_step(node* n, bool from_left);

  /**
   * Walks from the parent of a spliced node toward the root, applying repair
   * steps until one reports done.
   */
  size_type rebalance_after_erase(node* n);
  static EraseCase classify_erase(node* n);
  rebalance_step apply_erase_step(node* n);

  /**
   * Decrements both of n's differences and increments its parent's
   * difference toward n.
   */
  static void demote(node* n);

  static void refresh_sizes_upward(node* n);

  /**
   * Iterative in-order traversal with an explicit stack.
   */
  template <typename Visitor>
  void for_each_in_order(Visitor&& visit) const;

  /**
   * Recursively checks the subtree rooted at n. Returns its rank, or
   * std::nullopt after describing the violation in diagnostic.
   */
  std::optional<int> check_subtree(const node* n, const node* parent,
                                   const Key* lower, const Key* upper,
                                   std::string* diagnostic) const;

  // Comparator instance
  [[no_unique_address]] Compare comp_;

  [[no_unique_address]] node_allocator node_alloc_;

  node* root_;

  // Cached smallest and largest nodes for O(1) min()/max()/begin()
  node* min_;
  node* max_;
};

/**
 * Integer keys with string values.
 */
using wavl_map = wavl_tree<int, std::string>;

}  // namespace kressler::wavl_containers

// Include implementation
#include "wavl_tree.ipp"
