// Implementation file for wavl_tree.hpp
// This file contains all method implementations for the wavl_tree class.

namespace kressler::wavl_containers {

// Constructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
wavl_tree<Key, Value, Compare, Allocator>::wavl_tree(const Allocator& alloc)
    : node_alloc_(alloc), root_(nullptr), min_(nullptr), max_(nullptr) {}

// Destructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
wavl_tree<Key, Value, Compare, Allocator>::~wavl_tree() {
  deallocate_subtree(root_);
}

// Copy constructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
wavl_tree<Key, Value, Compare, Allocator>::wavl_tree(const wavl_tree& other)
    : node_alloc_(node_alloc_traits::select_on_container_copy_construction(
          other.node_alloc_)),
      root_(nullptr),
      min_(nullptr),
      max_(nullptr) {
  root_ = clone_subtree(other.root_, nullptr);
  if (root_ != nullptr) {
    min_ = leftmost(root_);
    max_ = rightmost(root_);
  }
}

// Copy assignment operator
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
wavl_tree<Key, Value, Compare, Allocator>&
wavl_tree<Key, Value, Compare, Allocator>::operator=(const wavl_tree& other) {
  if (this != &other) {
    // Clone first so a throwing allocation leaves this tree untouched
    node* cloned = clone_subtree(other.root_, nullptr);
    clear();
    root_ = cloned;
    if (root_ != nullptr) {
      min_ = leftmost(root_);
      max_ = rightmost(root_);
    }
  }
  return *this;
}

// Move constructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
wavl_tree<Key, Value, Compare, Allocator>::wavl_tree(wavl_tree&& other) noexcept
    : node_alloc_(std::move(other.node_alloc_)),
      root_(other.root_),
      min_(other.min_),
      max_(other.max_) {
  // Leave other in a valid empty state
  other.root_ = nullptr;
  other.min_ = nullptr;
  other.max_ = nullptr;
}

// Move assignment operator
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
wavl_tree<Key, Value, Compare, Allocator>&
wavl_tree<Key, Value, Compare, Allocator>::operator=(
    wavl_tree&& other) noexcept {
  if (this != &other) {
    deallocate_subtree(root_);

    node_alloc_ = std::move(other.node_alloc_);
    root_ = other.root_;
    min_ = other.min_;
    max_ = other.max_;

    other.root_ = nullptr;
    other.min_ = nullptr;
    other.max_ = nullptr;
  }
  return *this;
}

// Initializer list constructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
wavl_tree<Key, Value, Compare, Allocator>::wavl_tree(
    std::initializer_list<value_type> init, const Allocator& alloc)
    : wavl_tree(alloc) {
  for (const auto& elem : init) {
    insert(elem.first, elem.second);
  }
}

// Range constructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename InputIt>
wavl_tree<Key, Value, Compare, Allocator>::wavl_tree(InputIt first,
                                                     InputIt last,
                                                     const Allocator& alloc)
    : wavl_tree(alloc) {
  for (auto it = first; it != last; ++it) {
    insert(it->first, it->second);
  }
}

// swap
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void wavl_tree<Key, Value, Compare, Allocator>::swap(
    wavl_tree& other) noexcept {
  using std::swap;
  swap(node_alloc_, other.node_alloc_);
  swap(root_, other.root_);
  swap(min_, other.min_);
  swap(max_, other.max_);
}

// clear
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void wavl_tree<Key, Value, Compare, Allocator>::clear() {
  deallocate_subtree(root_);
  root_ = nullptr;
  min_ = nullptr;
  max_ = nullptr;
}

// allocate_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename K, typename V>
typename wavl_tree<Key, Value, Compare, Allocator>::node*
wavl_tree<Key, Value, Compare, Allocator>::allocate_node(K&& key, V&& value,
                                                         node* parent) {
  node* n = node_alloc_traits::allocate(node_alloc_, 1);
  try {
    node_alloc_traits::construct(node_alloc_, n, std::forward<K>(key),
                                 std::forward<V>(value), parent);
  } catch (...) {
    node_alloc_traits::deallocate(node_alloc_, n, 1);
    throw;
  }
  return n;
}

// deallocate_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void wavl_tree<Key, Value, Compare, Allocator>::deallocate_node(node* n) {
  node_alloc_traits::destroy(node_alloc_, n);
  node_alloc_traits::deallocate(node_alloc_, n, 1);
}

// deallocate_subtree - recursion depth is bounded by the tree height
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void wavl_tree<Key, Value, Compare, Allocator>::deallocate_subtree(node* n) {
  if (n == nullptr) {
    return;
  }
  deallocate_subtree(n->left);
  deallocate_subtree(n->right);
  deallocate_node(n);
}

// clone_subtree - copies keys, values, rank differences and sizes
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename wavl_tree<Key, Value, Compare, Allocator>::node*
wavl_tree<Key, Value, Compare, Allocator>::clone_subtree(const node* source,
                                                         node* parent) {
  if (source == nullptr) {
    return nullptr;
  }
  node* copy = allocate_node(source->key, source->value, parent);
  copy->left_diff = source->left_diff;
  copy->right_diff = source->right_diff;
  copy->subtree_size = source->subtree_size;
  try {
    copy->left = clone_subtree(source->left, copy);
    copy->right = clone_subtree(source->right, copy);
  } catch (...) {
    deallocate_subtree(copy);
    throw;
  }
  return copy;
}

// leftmost
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename wavl_tree<Key, Value, Compare, Allocator>::node*
wavl_tree<Key, Value, Compare, Allocator>::leftmost(node* n) {
  while (n->left != nullptr) {
    n = n->left;
  }
  return n;
}

// rightmost
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename wavl_tree<Key, Value, Compare, Allocator>::node*
wavl_tree<Key, Value, Compare, Allocator>::rightmost(node* n) {
  while (n->right != nullptr) {
    n = n->right;
  }
  return n;
}

// successor - nullptr past the largest node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename wavl_tree<Key, Value, Compare, Allocator>::node*
wavl_tree<Key, Value, Compare, Allocator>::successor(node* n) {
  if (n->right != nullptr) {
    return leftmost(n->right);
  }
  node* parent = n->parent;
  while (parent != nullptr && parent->right == n) {
    n = parent;
    parent = parent->parent;
  }
  return parent;
}

// predecessor - nullptr before the smallest node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename wavl_tree<Key, Value, Compare, Allocator>::node*
wavl_tree<Key, Value, Compare, Allocator>::predecessor(node* n) {
  if (n->left != nullptr) {
    return rightmost(n->left);
  }
  node* parent = n->parent;
  while (parent != nullptr && parent->left == n) {
    n = parent;
    parent = parent->parent;
  }
  return parent;
}

// find_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename wavl_tree<Key, Value, Compare, Allocator>::node*
wavl_tree<Key, Value, Compare, Allocator>::find_node(const Key& key) const {
  node* n = root_;
  while (n != nullptr) {
    if (comp_(key, n->key)) {
      n = n->left;
    } else if (comp_(n->key, key)) {
      n = n->right;
    } else {
      return n;
    }
  }
  return nullptr;
}

// find_insert_position
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename wavl_tree<Key, Value, Compare, Allocator>::insert_position
wavl_tree<Key, Value, Compare, Allocator>::find_insert_position(
    const Key& key) const {
  insert_position pos{nullptr, nullptr, false};
  node* n = root_;
  while (n != nullptr) {
    pos.parent = n;
    if (comp_(key, n->key)) {
      pos.as_left = true;
      n = n->left;
    } else if (comp_(n->key, key)) {
      pos.as_left = false;
      n = n->right;
    } else {
      pos.match = n;
      return pos;
    }
  }
  return pos;
}

// search
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::optional<Value> wavl_tree<Key, Value, Compare, Allocator>::search(
    const Key& key) const {
  const node* n = find_node(key);
  if (n == nullptr) {
    return std::nullopt;
  }
  return n->value;
}

// find (non-const)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename wavl_tree<Key, Value, Compare, Allocator>::iterator
wavl_tree<Key, Value, Compare, Allocator>::find(const Key& key) {
  return iterator(find_node(key), this);
}

// find (const)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename wavl_tree<Key, Value, Compare, Allocator>::const_iterator
wavl_tree<Key, Value, Compare, Allocator>::find(const Key& key) const {
  return const_iterator(find_node(key), this);
}

// at (non-const)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
Value& wavl_tree<Key, Value, Compare, Allocator>::at(const Key& key) {
  node* n = find_node(key);
  if (n == nullptr) {
    throw std::out_of_range("wavl_tree::at: key not found");
  }
  return n->value;
}

// at (const)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
const Value& wavl_tree<Key, Value, Compare, Allocator>::at(
    const Key& key) const {
  const node* n = find_node(key);
  if (n == nullptr) {
    throw std::out_of_range("wavl_tree::at: key not found");
  }
  return n->value;
}

// insert
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::optional<typename wavl_tree<Key, Value, Compare, Allocator>::size_type>
wavl_tree<Key, Value, Compare, Allocator>::insert(const Key& key,
                                                  const Value& value) {
  const insert_position pos = find_insert_position(key);
  if (pos.match != nullptr) {
    return std::nullopt;  // Duplicate key, nothing touched
  }
  return insert_at(pos, key, value).second;
}

// insert_or_assign
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename M>
std::pair<typename wavl_tree<Key, Value, Compare, Allocator>::iterator, bool>
wavl_tree<Key, Value, Compare, Allocator>::insert_or_assign(const Key& key,
                                                            M&& value) {
  const insert_position pos = find_insert_position(key);
  if (pos.match != nullptr) {
    pos.match->value = std::forward<M>(value);
    return {iterator(pos.match, this), false};
  }
  node* leaf = insert_at(pos, key, std::forward<M>(value)).first;
  return {iterator(leaf, this), true};
}

// insert_at
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename V>
std::pair<typename wavl_tree<Key, Value, Compare, Allocator>::node*,
          typename wavl_tree<Key, Value, Compare, Allocator>::size_type>
wavl_tree<Key, Value, Compare, Allocator>::insert_at(const insert_position& pos,
                                                     const Key& key,
                                                     V&& value) {
  node* leaf = allocate_node(key, std::forward<V>(value), pos.parent);

  if (pos.parent == nullptr) {
    root_ = leaf;
  } else {
    child_slot(pos.parent, pos.as_left) = leaf;
  }

  if (min_ == nullptr || comp_(leaf->key, min_->key)) {
    min_ = leaf;
  }
  if (max_ == nullptr || comp_(max_->key, leaf->key)) {
    max_ = leaf;
  }

  const size_type operations = rebalance_after_insert(leaf);

  // Rotations only refresh the rotated pair; every stale size sits on the
  // path from the leaf to the root
  refresh_sizes_upward(leaf->parent);
  return {leaf, operations};
}

// erase (by key)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::optional<typename wavl_tree<Key, Value, Compare, Allocator>::size_type>
wavl_tree<Key, Value, Compare, Allocator>::erase(const Key& key) {
  node* n = find_node(key);
  if (n == nullptr) {
    return std::nullopt;  // Key not found
  }
  return erase_node(n);
}

// erase (by iterator)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename wavl_tree<Key, Value, Compare, Allocator>::iterator
wavl_tree<Key, Value, Compare, Allocator>::erase(const_iterator pos) {
  assert(pos.node_ != nullptr && "Erasing end iterator");
  node* n = pos.node_;

  // With two children, n receives its successor's payload and stays in the
  // tree, so n itself is the next element afterwards
  node* next = (n->left != nullptr && n->right != nullptr) ? n : successor(n);
  erase_node(n);
  return iterator(next, this);
}

// erase_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename wavl_tree<Key, Value, Compare, Allocator>::size_type
wavl_tree<Key, Value, Compare, Allocator>::erase_node(node* n) {
  node* removed = n;
  if (n->left != nullptr && n->right != nullptr) {
    // Copy the successor's payload in; the successor has no left child
    removed = leftmost(n->right);
    n->key = std::move(removed->key);
    n->value = std::move(removed->value);
  }

  // The physically removed node may be cached even when the erased key was
  // not the extreme one (its payload moved into n)
  const bool reset_min = min_ == n || min_ == removed;
  const bool reset_max = max_ == n || max_ == removed;

  // Splice: the only child (or nothing) takes the removed node's slot
  node* parent = removed->parent;
  node* orphan = removed->left != nullptr ? removed->left : removed->right;
  if (orphan != nullptr) {
    orphan->parent = parent;
  }

  size_type operations = 0;
  if (parent == nullptr) {
    root_ = orphan;
  } else {
    const bool was_left = parent->left == removed;
    child_slot(parent, was_left) = orphan;
    ++diff_slot(parent, was_left);
    operations = rebalance_after_erase(parent);
    refresh_sizes_upward(parent);
  }

  if (root_ == nullptr) {
    min_ = nullptr;
    max_ = nullptr;
  } else {
    if (reset_min) {
      min_ = leftmost(root_);
    }
    if (reset_max) {
      max_ = rightmost(root_);
    }
  }

  deallocate_node(removed);
  return operations;
}

// rotate_up
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void wavl_tree<Key, Value, Compare, Allocator>::rotate_up(node* child) {
  node* parent = child->parent;
  assert(parent != nullptr && "Rotating the root");
  node* grandparent = parent->parent;
  const bool child_was_left = parent->left == child;

  // Take over the parent's slot
  child->parent = grandparent;
  if (grandparent == nullptr) {
    root_ = child;
  } else {
    child_slot(grandparent, grandparent->left == parent) = child;
  }

  // The child's inner subtree moves across to the parent
  node* inner = child_slot(child, !child_was_left);
  child_slot(parent, child_was_left) = inner;
  if (inner != nullptr) {
    inner->parent = parent;
  }
  child_slot(child, !child_was_left) = parent;
  parent->parent = child;

  refresh_size(parent);
  refresh_size(child);
}

// rebalance_after_insert
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename wavl_tree<Key, Value, Compare, Allocator>::size_type
wavl_tree<Key, Value, Compare, Allocator>::rebalance_after_insert(node* leaf) {
  size_type operations = 0;
  node* child = leaf;
  node* n = leaf->parent;

  while (n != nullptr) {
    const bool from_left = n->left == child;
    // The child's rank went up by one
    --diff_slot(n, from_left);

    const rebalance_step step = apply_insert_step(n, from_left);
    operations += step.operations;
    if (step.done) {
      break;
    }
    child = n;
    n = n->parent;
  }
  return operations;
}

// classify_insert
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
InsertCase wavl_tree<Key, Value, Compare, Allocator>::classify_insert(
    node* n, bool from_left) {
  if (diff_of(n, from_left) != 0) {
    return InsertCase::Stop;
  }
  if (diff_of(n, !from_left) == 1) {
    return InsertCase::Promote;
  }

  // 0,2 node. The child was just promoted, so it is a 1,2 node.
  const node* child = child_slot(n, from_left);
  if (diff_of(child, !from_left) == 2) {
    return InsertCase::Rotate;
  }
  return InsertCase::DoubleRotate;
}

// apply_insert_step
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename wavl_tree<Key, Value, Compare, Allocator>::rebalance_step
wavl_tree<Key, Value, Compare, Allocator>::apply_insert_step(node* n,
                                                             bool from_left) {
  switch (classify_insert(n, from_left)) {
    case InsertCase::Promote:
      ++n->left_diff;
      ++n->right_diff;
      return {rebalance_cost::promote, false};

    case InsertCase::Rotate: {
      node* child = child_slot(n, from_left);
      n->left_diff = 1;
      n->right_diff = 1;
      child->left_diff = 1;
      child->right_diff = 1;
      rotate_up(child);
      return {rebalance_cost::insert_rotate, true};
    }

    case InsertCase::DoubleRotate: {
      node* child = child_slot(n, from_left);
      node* inner = child_slot(child, !from_left);
      assert(inner != nullptr && "Double rotation without inner grandchild");

      // inner ends up on top with n and child as its 1,1 children
      diff_slot(n, from_left) = diff_of(inner, !from_left);
      diff_slot(n, !from_left) = 1;
      diff_slot(child, from_left) = 1;
      diff_slot(child, !from_left) = diff_of(inner, from_left);
      inner->left_diff = 1;
      inner->right_diff = 1;
      rotate_up(inner);
      rotate_up(inner);
      return {rebalance_cost::insert_double_rotate, true};
    }

    case InsertCase::Stop:
      break;
  }
  return {0, true};
}

// rebalance_after_erase
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename wavl_tree<Key, Value, Compare, Allocator>::size_type
wavl_tree<Key, Value, Compare, Allocator>::rebalance_after_erase(node* n) {
  size_type operations = 0;
  while (n != nullptr) {
    const rebalance_step step = apply_erase_step(n);
    operations += step.operations;
    if (step.done) {
      break;
    }
    n = n->parent;
  }
  return operations;
}

// classify_erase
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
EraseCase wavl_tree<Key, Value, Compare, Allocator>::classify_erase(node* n) {
  const std::uint8_t left = n->left_diff;
  const std::uint8_t right = n->right_diff;

  if ((left == 3 && right == 2) || (left == 2 && right == 3) ||
      (left == 2 && right == 2 && is_leaf(n))) {
    return EraseCase::Demote;
  }
  if (!((left == 3 && right == 1) || (left == 1 && right == 3))) {
    return EraseCase::Stop;
  }

  // 3,1 node: look at the child on the 1 side
  const bool sibling_left = left == 1;
  const node* sibling = child_slot(n, sibling_left);
  assert(sibling != nullptr && "3,1 node without a sibling");
  if (sibling->left_diff == 2 && sibling->right_diff == 2) {
    return EraseCase::DoubleDemote;
  }
  if (diff_of(sibling, sibling_left) == 1) {
    return EraseCase::Rotate;
  }
  return EraseCase::DoubleRotate;
}

// apply_erase_step
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename wavl_tree<Key, Value, Compare, Allocator>::rebalance_step
wavl_tree<Key, Value, Compare, Allocator>::apply_erase_step(node* n) {
  const EraseCase which = classify_erase(n);
  if (which == EraseCase::Stop) {
    return {0, true};
  }
  if (which == EraseCase::Demote) {
    demote(n);
    return {rebalance_cost::demote, false};
  }

  // Remaining cases act on a 3,1 node. Outer/inner are relative to the
  // sibling: the outer side points away from n.
  const bool sibling_left = n->left_diff == 1;
  const bool short_left = !sibling_left;
  node* sibling = child_slot(n, sibling_left);

  switch (which) {
    case EraseCase::DoubleDemote:
      demote(sibling);
      demote(n);
      return {rebalance_cost::double_demote, false};

    case EraseCase::Rotate: {
      diff_slot(n, short_left) = 2;
      diff_slot(n, sibling_left) = diff_of(sibling, short_left);
      ++diff_slot(sibling, sibling_left);
      diff_slot(sibling, short_left) = 1;
      rotate_up(sibling);

      size_type operations = rebalance_cost::erase_rotate;
      if (n->left_diff == 2 && n->right_diff == 2) {
        demote(n);
        operations += rebalance_cost::demote;
      }
      return {operations, true};
    }

    case EraseCase::DoubleRotate: {
      node* inner = child_slot(sibling, short_left);
      assert(inner != nullptr && "Double rotation without inner grandchild");

      // inner ends up on top with n and sibling as its 2,2 children
      diff_slot(n, short_left) = 1;
      diff_slot(n, sibling_left) = diff_of(inner, short_left);
      --diff_slot(sibling, sibling_left);
      diff_slot(sibling, short_left) = diff_of(inner, sibling_left);
      inner->left_diff = 2;
      inner->right_diff = 2;
      rotate_up(inner);
      rotate_up(inner);
      return {rebalance_cost::erase_double_rotate, true};
    }

    default:
      break;
  }
  return {0, true};
}

// demote
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void wavl_tree<Key, Value, Compare, Allocator>::demote(node* n) {
  --n->left_diff;
  --n->right_diff;
  if (n->parent != nullptr) {
    ++diff_slot(n->parent, n->parent->left == n);
  }
}

// refresh_sizes_upward
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void wavl_tree<Key, Value, Compare, Allocator>::refresh_sizes_upward(
    node* n) {
  while (n != nullptr) {
    refresh_size(n);
    n = n->parent;
  }
}

// min
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::optional<Value> wavl_tree<Key, Value, Compare, Allocator>::min() const {
  if (min_ == nullptr) {
    return std::nullopt;
  }
  return min_->value;
}

// max
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::optional<Value> wavl_tree<Key, Value, Compare, Allocator>::max() const {
  if (max_ == nullptr) {
    return std::nullopt;
  }
  return max_->value;
}

// select
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::optional<Value> wavl_tree<Key, Value, Compare, Allocator>::select(
    size_type rank) const {
  if (rank == 0 || rank > size()) {
    return std::nullopt;
  }

  // Number of smaller keys the answer still has to skip
  size_type remaining = rank - 1;
  const node* n = root_;
  while (n != nullptr) {
    const size_type left_size = size_of(n->left);
    if (remaining == left_size) {
      return n->value;
    }
    if (remaining < left_size) {
      n = n->left;
    } else {
      remaining -= left_size + 1;
      n = n->right;
    }
  }
  return std::nullopt;
}

// for_each_in_order
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename Visitor>
void wavl_tree<Key, Value, Compare, Allocator>::for_each_in_order(
    Visitor&& visit) const {
  std::vector<const node*> stack;
  const node* n = root_;
  while (n != nullptr || !stack.empty()) {
    // Push the left spine, then visit the deepest pending node
    while (n != nullptr) {
      stack.push_back(n);
      n = n->left;
    }
    n = stack.back();
    stack.pop_back();
    visit(*n);
    n = n->right;
  }
}

// keys_to_array
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::vector<Key> wavl_tree<Key, Value, Compare, Allocator>::keys_to_array()
    const {
  std::vector<Key> keys;
  keys.reserve(size());
  for_each_in_order([&keys](const node& n) { keys.push_back(n.key); });
  return keys;
}

// values_to_array
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::vector<Value> wavl_tree<Key, Value, Compare, Allocator>::values_to_array()
    const {
  std::vector<Value> values;
  values.reserve(size());
  for_each_in_order([&values](const node& n) { values.push_back(n.value); });
  return values;
}

// rank - sum of the left differences down the left spine, from rank -1
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
int wavl_tree<Key, Value, Compare, Allocator>::rank() const {
  int r = -1;
  for (const node* n = root_; n != nullptr; n = n->left) {
    r += n->left_diff;
  }
  return r;
}

// height
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
int wavl_tree<Key, Value, Compare, Allocator>::height() const {
  if (root_ == nullptr) {
    return -1;
  }

  // Depth-first walk carrying the depth of each pending node
  int deepest = 0;
  std::vector<std::pair<const node*, int>> stack;
  stack.emplace_back(root_, 0);
  while (!stack.empty()) {
    auto [n, depth] = stack.back();
    stack.pop_back();
    if (depth > deepest) {
      deepest = depth;
    }
    if (n->left != nullptr) {
      stack.emplace_back(n->left, depth + 1);
    }
    if (n->right != nullptr) {
      stack.emplace_back(n->right, depth + 1);
    }
  }
  return deepest;
}

// validate_invariants
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bool wavl_tree<Key, Value, Compare, Allocator>::validate_invariants(
    std::string* diagnostic) const {
  auto fail = [diagnostic](const char* message) {
    if (diagnostic != nullptr) {
      *diagnostic = message;
    }
    return false;
  };

  if (root_ == nullptr) {
    if (min_ != nullptr || max_ != nullptr) {
      return fail("empty tree with non-null min/max cache");
    }
    return true;
  }
  if (root_->parent != nullptr) {
    return fail("root has a parent");
  }
  if (!check_subtree(root_, nullptr, nullptr, nullptr, diagnostic)) {
    return false;
  }
  if (min_ != leftmost(root_)) {
    return fail("min cache does not point at the leftmost node");
  }
  if (max_ != rightmost(root_)) {
    return fail("max cache does not point at the rightmost node");
  }
  return true;
}

// check_subtree
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::optional<int> wavl_tree<Key, Value, Compare, Allocator>::check_subtree(
    const node* n, const node* parent, const Key* lower, const Key* upper,
    std::string* diagnostic) const {
  auto fail = [diagnostic](const char* message) -> std::optional<int> {
    if (diagnostic != nullptr) {
      *diagnostic = message;
    }
    return std::nullopt;
  };

  if (n == nullptr) {
    return -1;
  }
  if (n->parent != parent) {
    return fail("parent link does not match the owning node");
  }
  if ((lower != nullptr && !comp_(*lower, n->key)) ||
      (upper != nullptr && !comp_(n->key, *upper))) {
    return fail("key out of order");
  }
  if (n->left_diff < 1 || n->left_diff > 2 || n->right_diff < 1 ||
      n->right_diff > 2) {
    return fail("rank difference outside {1,2}");
  }
  if (is_leaf(n) && (n->left_diff != 1 || n->right_diff != 1)) {
    return fail("leaf is not a 1,1 node");
  }

  const std::optional<int> left_rank =
      check_subtree(n->left, n, lower, &n->key, diagnostic);
  if (!left_rank) {
    return std::nullopt;
  }
  const std::optional<int> right_rank =
      check_subtree(n->right, n, &n->key, upper, diagnostic);
  if (!right_rank) {
    return std::nullopt;
  }
  if (*left_rank + n->left_diff != *right_rank + n->right_diff) {
    return fail("left and right rank differences disagree on the rank");
  }
  if (n->subtree_size != size_of(n->left) + size_of(n->right) + 1) {
    return fail("cached subtree size is stale");
  }
  return *left_rank + n->left_diff;
}

}  // namespace kressler::wavl_containers
