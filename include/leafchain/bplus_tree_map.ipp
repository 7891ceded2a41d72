// Implementation file for bplus_tree_map.hpp
// This file contains all method implementations for the bplus_tree_map class.

#include <algorithm>
#include <iterator>

namespace leafchain {

// node::lower_bound
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename bplus_tree_map<Key, Value, Compare, Allocator>::size_type
bplus_tree_map<Key, Value, Compare, Allocator>::node::lower_bound(
    const Key& key, const Compare& comp) const {
  auto it = std::lower_bound(keys.begin(), keys.end(), key, comp);
  return static_cast<size_type>(std::distance(keys.begin(), it));
}

// node::index_of
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::optional<typename bplus_tree_map<Key, Value, Compare, Allocator>::size_type>
bplus_tree_map<Key, Value, Compare, Allocator>::node::index_of(
    const Key& key, const Compare& comp) const {
  const size_type pos = lower_bound(key, comp);
  // lower_bound guarantees !comp(keys[pos], key); equal if also !comp(key, ..)
  if (pos < keys.size() && !comp(key, keys[pos])) {
    return pos;
  }
  return std::nullopt;
}

// node::insert_key_ordered
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename bplus_tree_map<Key, Value, Compare, Allocator>::size_type
bplus_tree_map<Key, Value, Compare, Allocator>::node::insert_key_ordered(
    const Key& key, const Compare& comp) {
  const size_type pos = lower_bound(key, comp);
  keys.insert(keys.begin() + pos, key);
  return pos;
}

// node::set_value_for_key
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void bplus_tree_map<Key, Value, Compare, Allocator>::node::set_value_for_key(
    size_type index, const Value& value) {
  assert(values.size() + 1 == keys.size() &&
         "set_value_for_key: key must be inserted first");
  if (index < values.size()) {
    values.insert(values.begin() + index, value);
  } else {
    values.push_back(value);
  }
}

// node::child_index
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename bplus_tree_map<Key, Value, Compare, Allocator>::size_type
bplus_tree_map<Key, Value, Compare, Allocator>::node::child_index(
    const node* child) const {
  auto it = std::find(children.begin(), children.end(), child);
  assert(it != children.end() && "child_index: not a child of this node");
  return static_cast<size_type>(std::distance(children.begin(), it));
}

// Constructor (default order)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bplus_tree_map<Key, Value, Compare, Allocator>::bplus_tree_map(
    const Compare& comp, const Allocator& alloc)
    : bplus_tree_map(default_order, comp, alloc) {}

// Constructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bplus_tree_map<Key, Value, Compare, Allocator>::bplus_tree_map(
    size_type order, const Compare& comp, const Allocator& alloc)
    : comp_(comp),
      node_alloc_(alloc),
      order_(order),
      root_(nullptr),
      size_(0),
      leftmost_leaf_(nullptr) {
  if (order_ < min_order) {
    throw invalid_order_error(order_, min_order);
  }
}

// Destructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bplus_tree_map<Key, Value, Compare, Allocator>::~bplus_tree_map() {
  deallocate_tree();
}

// Copy constructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bplus_tree_map<Key, Value, Compare, Allocator>::bplus_tree_map(
    const bplus_tree_map& other)
    : bplus_tree_map(other.order_, other.comp_,
                     std::allocator_traits<Allocator>::
                         select_on_container_copy_construction(
                             other.get_allocator())) {
  // Delegating makes this a complete object, so the destructor frees the
  // nodes built so far if a put throws
  for (const auto& [key, value] : other) {
    put(key, value);
  }
}

// Copy assignment operator
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bplus_tree_map<Key, Value, Compare, Allocator>&
bplus_tree_map<Key, Value, Compare, Allocator>::operator=(
    const bplus_tree_map& other) {
  if (this != &other) {
    clear();
    if constexpr (node_alloc_traits::propagate_on_container_copy_assignment::
                      value) {
      node_alloc_ = other.node_alloc_;
    }
    comp_ = other.comp_;
    order_ = other.order_;
    for (const auto& [key, value] : other) {
      put(key, value);
    }
  }
  return *this;
}

// Move constructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bplus_tree_map<Key, Value, Compare, Allocator>::bplus_tree_map(
    bplus_tree_map&& other) noexcept
    : comp_(other.comp_),
      node_alloc_(std::move(other.node_alloc_)),
      order_(other.order_),
      root_(other.root_),
      size_(other.size_),
      leftmost_leaf_(other.leftmost_leaf_) {
  // Leave other in a valid empty state
  other.root_ = nullptr;
  other.size_ = 0;
  other.leftmost_leaf_ = nullptr;
}

// Move assignment operator
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bplus_tree_map<Key, Value, Compare, Allocator>&
bplus_tree_map<Key, Value, Compare, Allocator>::operator=(
    bplus_tree_map&& other) noexcept {
  if (this != &other) {
    deallocate_tree();

    if constexpr (node_alloc_traits::propagate_on_container_move_assignment::
                      value) {
      node_alloc_ = std::move(other.node_alloc_);
    }
    comp_ = other.comp_;
    order_ = other.order_;
    root_ = other.root_;
    size_ = other.size_;
    leftmost_leaf_ = other.leftmost_leaf_;

    other.root_ = nullptr;
    other.size_ = 0;
    other.leftmost_leaf_ = nullptr;
  }
  return *this;
}

// swap
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void bplus_tree_map<Key, Value, Compare, Allocator>::swap(
    bplus_tree_map& other) noexcept {
  using std::swap;
  if constexpr (node_alloc_traits::propagate_on_container_swap::value) {
    swap(node_alloc_, other.node_alloc_);
  }
  swap(comp_, other.comp_);
  swap(order_, other.order_);
  swap(root_, other.root_);
  swap(size_, other.size_);
  swap(leftmost_leaf_, other.leftmost_leaf_);
}

// height
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename bplus_tree_map<Key, Value, Compare, Allocator>::size_type
bplus_tree_map<Key, Value, Compare, Allocator>::height() const {
  size_type levels = 0;
  for (const node* n = root_; n != nullptr;
       n = n->is_leaf ? nullptr : n->children.front()) {
    ++levels;
  }
  return levels;
}

// stats
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
tree_stats bplus_tree_map<Key, Value, Compare, Allocator>::stats() const {
  tree_stats result;
  result.height = height();
  if (root_ == nullptr) {
    return result;
  }

  std::vector<const node*> pending{root_};
  while (!pending.empty()) {
    const node* n = pending.back();
    pending.pop_back();
    if (n->is_leaf) {
      ++result.leaves;
      result.size += n->keys.size();
    } else {
      ++result.inner_nodes;
      pending.insert(pending.end(), n->children.begin(), n->children.end());
    }
  }
  return result;
}

// locate_leaf
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename bplus_tree_map<Key, Value, Compare, Allocator>::node*
bplus_tree_map<Key, Value, Compare, Allocator>::locate_leaf(
    const Key& key) const {
  if (root_ == nullptr) {
    throw empty_tree_error("bplus_tree_map::locate_leaf: tree is empty");
  }

  node* current = root_;
  while (!current->is_leaf) {
    // Child i holds keys in [keys[i - 1], keys[i]). upper_bound yields the
    // number of separators <= key, which is exactly that child index, and
    // sends a key equal to a separator to the right of it.
    auto it = std::upper_bound(current->keys.begin(), current->keys.end(), key,
                               comp_);
    current = current->children[std::distance(current->keys.begin(), it)];
  }
  return current;
}

// find
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename bplus_tree_map<Key, Value, Compare, Allocator>::const_iterator
bplus_tree_map<Key, Value, Compare, Allocator>::find(const Key& key) const {
  if (empty()) {
    return end();
  }

  const node* leaf = locate_leaf(key);
  auto index = leaf->index_of(key, comp_);
  if (!index) {
    return end();
  }
  return const_iterator(leaf, *index);
}

// contains_key
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bool bplus_tree_map<Key, Value, Compare, Allocator>::contains_key(
    const Key& key) const {
  if (empty()) {
    return false;
  }
  return locate_leaf(key)->index_of(key, comp_).has_value();
}

// get (non-const)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
Value& bplus_tree_map<Key, Value, Compare, Allocator>::get(const Key& key) {
  if (empty()) {
    throw no_such_key_error("bplus_tree_map::get: key not found");
  }

  node* leaf = locate_leaf(key);
  auto index = leaf->index_of(key, comp_);
  if (!index) {
    throw no_such_key_error("bplus_tree_map::get: key not found");
  }
  return leaf->values[*index];
}

// get (const)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
const Value& bplus_tree_map<Key, Value, Compare, Allocator>::get(
    const Key& key) const {
  auto it = find(key);
  if (it == end()) {
    throw no_such_key_error("bplus_tree_map::get: key not found");
  }
  return it->second;
}

// put
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
const Value& bplus_tree_map<Key, Value, Compare, Allocator>::put(
    const Key& key, const Value& value) {
  // First entry - the root starts out as a single leaf
  if (root_ == nullptr) {
    node* leaf = allocate_node(true);
    try {
      leaf->keys.push_back(key);
      leaf->values.push_back(value);
    } catch (...) {
      deallocate_node(leaf);
      throw;
    }
    root_ = leaf;
    leftmost_leaf_ = leaf;
    size_ = 1;
    return leaf->values.front();
  }

  node* leaf = locate_leaf(key);

  // Existing key - overwrite in place, no structural change
  if (auto index = leaf->index_of(key, comp_)) {
    leaf->values[*index] = value;
    return leaf->values[*index];
  }

  // Every node the split needs is allocated before the leaf changes, so a
  // failed allocation leaves the map as it was
  std::vector<node*> spares = allocate_split_nodes(leaf);

  size_type index = 0;
  bool key_inserted = false;
  bool value_inserted = false;
  try {
    index = leaf->insert_key_ordered(key, comp_);
    key_inserted = true;
    leaf->set_value_for_key(index, value);
    value_inserted = true;
    if (leaf->keys.size() >= order_) {
      // Only the copy of the leaf separator can throw, and it runs before
      // any node is reshaped
      split_node(leaf, spares);
    }
  } catch (...) {
    if (value_inserted) {
      leaf->values.erase(leaf->values.begin() + index);
    }
    if (key_inserted) {
      leaf->keys.erase(leaf->keys.begin() + index);
    }
    release_nodes(spares);
    throw;
  }
  assert(spares.empty() && "put: unused split nodes");
  size_++;

  // The leaf kept the lower half; the pair may have moved to the new right
  // sibling
  if (index >= leaf->keys.size()) {
    index -= leaf->keys.size();
    leaf = leaf->next;
  }
  return leaf->values[index];
}

// split_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void bplus_tree_map<Key, Value, Compare, Allocator>::split_node(
    node* n, std::vector<node*>& spares) {
  assert(n->keys.size() == order_ && "split_node: node is not full");
  assert(!spares.empty() && "split_node: no node reserved for the split");

  const size_type split_point = order_ / 2;

  // A leaf keeps its copy of the separator; an internal node gives it up
  Key separator = n->is_leaf ? Key(n->keys[split_point])
                             : std::move(n->keys[split_point]);

  node* right = spares.back();
  spares.pop_back();
  assert(right->is_leaf == n->is_leaf && "split_node: spare of wrong kind");

  if (n->is_leaf) {
    // Leaf entries are never dropped; the separator is a copy of the right
    // half's first key
    right->keys.assign(std::make_move_iterator(n->keys.begin() + split_point),
                       std::make_move_iterator(n->keys.end()));
    right->values.assign(
        std::make_move_iterator(n->values.begin() + split_point),
        std::make_move_iterator(n->values.end()));
    n->keys.erase(n->keys.begin() + split_point, n->keys.end());
    n->values.erase(n->values.begin() + split_point, n->values.end());

    // Splice the new leaf into the chain right after n
    right->next = n->next;
    n->next = right;
  } else {
    // The separator moves up; keys after it go right along with the
    // children to their right
    right->keys.assign(
        std::make_move_iterator(n->keys.begin() + split_point + 1),
        std::make_move_iterator(n->keys.end()));
    right->children.assign(n->children.begin() + split_point + 1,
                           n->children.end());
    n->keys.erase(n->keys.begin() + split_point, n->keys.end());
    n->children.erase(n->children.begin() + split_point + 1,
                      n->children.end());

    for (node* child : right->children) {
      child->parent = right;
    }
  }

  // Case 1: n is root - grow the tree by one level
  if (n->parent == nullptr) {
    node* new_root = spares.back();
    spares.pop_back();
    new_root->keys.push_back(std::move(separator));
    new_root->children.push_back(n);
    new_root->children.push_back(right);
    n->parent = new_root;
    right->parent = new_root;
    root_ = new_root;
    return;
  }

  // Case 2: parent exists - right goes immediately after n, and the
  // separator sits between them
  node* parent = n->parent;
  const size_type slot = parent->child_index(n);
  parent->keys.insert(parent->keys.begin() + slot, std::move(separator));
  parent->children.insert(parent->children.begin() + slot + 1, right);
  right->parent = parent;

  if (parent->keys.size() >= order_) {
    split_node(parent, spares);
  }
}

// clear
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void bplus_tree_map<Key, Value, Compare, Allocator>::clear() {
  deallocate_tree();
}

// key_set
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::vector<Key> bplus_tree_map<Key, Value, Compare, Allocator>::key_set()
    const {
  std::vector<Key> result;
  result.reserve(size_);
  for (const node* leaf = leftmost_leaf_; leaf != nullptr; leaf = leaf->next) {
    result.insert(result.end(), leaf->keys.begin(), leaf->keys.end());
  }
  return result;
}

// values
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::vector<Value> bplus_tree_map<Key, Value, Compare, Allocator>::values()
    const {
  std::vector<Value> result;
  result.reserve(size_);
  for (const node* leaf = leftmost_leaf_; leaf != nullptr; leaf = leaf->next) {
    result.insert(result.end(), leaf->values.begin(), leaf->values.end());
  }
  return result;
}

// entry_set
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::vector<typename bplus_tree_map<Key, Value, Compare, Allocator>::entry>
bplus_tree_map<Key, Value, Compare, Allocator>::entry_set() const {
  std::vector<entry> result;
  result.reserve(size_);
  for (const auto& [key, value] : *this) {
    result.push_back(entry{key, value});
  }
  return result;
}

// contains_value
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bool bplus_tree_map<Key, Value, Compare, Allocator>::contains_value(
    const Value& /*value*/) const {
  throw unsupported_operation_error("contains_value");
}

// remove
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename bplus_tree_map<Key, Value, Compare, Allocator>::size_type
bplus_tree_map<Key, Value, Compare, Allocator>::remove(const Key& /*key*/) {
  throw unsupported_operation_error("remove");
}

// put_all
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename Map>
void bplus_tree_map<Key, Value, Compare, Allocator>::put_all(
    const Map& /*other*/) {
  throw unsupported_operation_error("put_all");
}

// verify
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void bplus_tree_map<Key, Value, Compare, Allocator>::verify() const {
  if (root_ == nullptr) {
    if (size_ != 0 || leftmost_leaf_ != nullptr) {
      throw invariant_violation("empty tree has leftover entries or leaves");
    }
    return;
  }
  if (root_->parent != nullptr) {
    throw invariant_violation("root has a parent");
  }

  std::optional<size_type> leaf_depth;
  std::vector<const node*> leaves;
  verify_node(root_, nullptr, nullptr, 0, leaf_depth, leaves);

  // The chain must visit exactly the leaves found by the in-order walk
  if (leftmost_leaf_ != leaves.front()) {
    throw invariant_violation("cached leftmost leaf is not the first leaf");
  }
  const node* chained = leftmost_leaf_;
  size_type entries = 0;
  const Key* previous = nullptr;
  for (const node* leaf : leaves) {
    if (chained != leaf) {
      throw invariant_violation("leaf chain skips or reorders leaves");
    }
    for (const Key& key : leaf->keys) {
      if (previous != nullptr && !comp_(*previous, key)) {
        throw invariant_violation("leaf chain keys are not strictly ascending");
      }
      previous = &key;
    }
    entries += leaf->keys.size();
    chained = chained->next;
  }
  if (chained != nullptr) {
    throw invariant_violation("leaf chain continues past the last leaf");
  }
  if (entries != size_) {
    throw invariant_violation("entry count does not match size()");
  }
}

// verify_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void bplus_tree_map<Key, Value, Compare, Allocator>::verify_node(
    const node* n, const Key* lower, const Key* upper, size_type depth,
    std::optional<size_type>& leaf_depth,
    std::vector<const node*>& leaves) const {
  if (n->keys.empty()) {
    throw invariant_violation("node has no keys");
  }
  if (n->keys.size() >= order_) {
    throw invariant_violation("node holds order() or more keys");
  }
  for (size_type i = 1; i < n->keys.size(); ++i) {
    if (!comp_(n->keys[i - 1], n->keys[i])) {
      throw invariant_violation("node keys are not strictly ascending");
    }
  }
  // Every key must lie in [lower, upper)
  if (lower != nullptr && comp_(n->keys.front(), *lower)) {
    throw invariant_violation("key is below its subtree's separator");
  }
  if (upper != nullptr && !comp_(n->keys.back(), *upper)) {
    throw invariant_violation("key is not below the next separator");
  }

  if (n->is_leaf) {
    if (n->values.size() != n->keys.size()) {
      throw invariant_violation("leaf keys and values differ in length");
    }
    if (!n->children.empty()) {
      throw invariant_violation("leaf has children");
    }
    if (!leaf_depth) {
      leaf_depth = depth;
    } else if (*leaf_depth != depth) {
      throw invariant_violation("leaves are not all at the same depth");
    }
    leaves.push_back(n);
    return;
  }

  if (n->children.size() != n->keys.size() + 1) {
    throw invariant_violation("internal node child count is not keys + 1");
  }
  if (!n->values.empty()) {
    throw invariant_violation("internal node stores values");
  }
  for (size_type i = 0; i < n->children.size(); ++i) {
    const node* child = n->children[i];
    if (child == nullptr) {
      throw invariant_violation("internal node has a null child");
    }
    if (child->parent != n) {
      throw invariant_violation("child's parent pointer is wrong");
    }
    const Key* child_lower = i == 0 ? lower : &n->keys[i - 1];
    const Key* child_upper = i == n->keys.size() ? upper : &n->keys[i];
    verify_node(child, child_lower, child_upper, depth + 1, leaf_depth, leaves);
  }
}

// allocate_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename bplus_tree_map<Key, Value, Compare, Allocator>::node*
bplus_tree_map<Key, Value, Compare, Allocator>::allocate_node(bool leaf) {
  node* n = node_alloc_traits::allocate(node_alloc_, 1);
  node_alloc_traits::construct(node_alloc_, n, leaf);

  // Room for the transient order_-th key, so inserts and splits never
  // reallocate
  try {
    n->keys.reserve(order_);
    if (leaf) {
      n->values.reserve(order_);
    } else {
      n->children.reserve(order_ + 1);
    }
  } catch (...) {
    deallocate_node(n);
    throw;
  }
  return n;
}

// allocate_split_nodes
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::vector<typename bplus_tree_map<Key, Value, Compare, Allocator>::node*>
bplus_tree_map<Key, Value, Compare, Allocator>::allocate_split_nodes(
    const node* leaf) {
  // A level splits only if the level below it did and it is one key short
  // of the order
  size_type levels = 0;
  bool grows = false;
  for (const node* n = leaf; n != nullptr && n->keys.size() + 1 >= order_;
       n = n->parent) {
    ++levels;
    grows = n->parent == nullptr;
  }

  std::vector<node*> spares;
  if (levels == 0) {
    return spares;
  }
  spares.reserve(levels + 1);

  // split_node takes from the back: the leaf's sibling first, the new root
  // last
  try {
    if (grows) {
      spares.push_back(allocate_node(false));
    }
    for (size_type level = levels; level > 0; --level) {
      spares.push_back(allocate_node(level == 1));
    }
  } catch (...) {
    release_nodes(spares);
    throw;
  }
  return spares;
}

// release_nodes
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void bplus_tree_map<Key, Value, Compare, Allocator>::release_nodes(
    std::vector<node*>& nodes) noexcept {
  for (node* n : nodes) {
    deallocate_node(n);
  }
  nodes.clear();
}

// deallocate_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void bplus_tree_map<Key, Value, Compare, Allocator>::deallocate_node(node* n) {
  node_alloc_traits::destroy(node_alloc_, n);
  node_alloc_traits::deallocate(node_alloc_, n, 1);
}

// deallocate_subtree
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void bplus_tree_map<Key, Value, Compare, Allocator>::deallocate_subtree(
    node* n) {
  for (node* child : n->children) {
    deallocate_subtree(child);
  }
  deallocate_node(n);
}

// deallocate_tree - releases every node and resets to the empty state
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void bplus_tree_map<Key, Value, Compare, Allocator>::deallocate_tree() {
  if (root_ != nullptr) {
    deallocate_subtree(root_);
  }
  root_ = nullptr;
  size_ = 0;
  leftmost_leaf_ = nullptr;
}

}  // namespace leafchain
