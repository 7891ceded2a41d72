// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cassert>
#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <utility>
#include <vector>

#include "errors.hpp"

namespace leafchain {

// Concept for a "less" predicate usable to order keys of type Key
template <typename Key, typename Compare>
concept ComparatorCompatible =
    requires(const Compare comp, const Key& a, const Key& b) {
      { comp(a, b) } -> std::convertible_to<bool>;
    } && std::copy_constructible<Compare>;

/**
 * Node counts gathered by bplus_tree_map::stats().
 */
struct tree_stats {
  std::size_t size = 0;
  std::size_t leaves = 0;
  std::size_t inner_nodes = 0;
  std::size_t height = 0;
};

/**
 * An ordered key-value map backed by a B+ tree whose order is chosen at
 * construction time. All entries live in leaf nodes, which form a singly
 * linked chain for ordered traversal. Internal nodes hold only separator keys
 * and child pointers.
 *
 * A node splits as soon as its key count reaches the order m, so in steady
 * state every node holds at most m - 1 keys. Deletion is not supported and
 * no minimum fill is enforced.
 *
 * The map is not synchronized. Concurrent use requires the caller to
 * serialize every put()/clear() with all other calls.
 *
 * @tparam Key The key type (must be ComparatorCompatible with Compare)
 * @tparam Value The mapped type
 * @tparam Compare Strict weak ordering over keys; two keys are equal when
 *         neither compares less than the other (defaults to std::less<Key>)
 * @tparam Allocator The allocator type; rebound to the node type for every
 *         node allocation (defaults to std::allocator<value_type>)
 *
 * Example:
 * @code
 * bplus_tree_map<int, std::string> map{4};
 * map.put(10, "ten");
 * map.put(5, "five");
 * for (auto [key, value] : map) {
 *   std::cout << key << " -> " << value << '\n';
 * }
 * @endcode
 */
template <typename Key, typename Value, typename Compare = std::less<Key>,
          typename Allocator = std::allocator<std::pair<Key, Value>>>
  requires ComparatorCompatible<Key, Compare>
class bplus_tree_map {
 public:
  // Type aliases
  using key_type = Key;
  using mapped_type = Value;
  using value_type = std::pair<Key, Value>;
  using size_type = std::size_t;
  using allocator_type = Allocator;
  using key_compare = Compare;

  // Order used when none is given
  static constexpr size_type default_order = 16;

  // Smallest order for which a split can produce two non-empty halves
  static constexpr size_type min_order = 3;

  /**
   * A snapshot of one key-value pair, as produced by entry_set(). Changing an
   * entry does not write through to the map; use put() for that.
   */
  struct entry {
    Key key;
    Value value;

    bool operator==(const entry&) const = default;

    friend std::ostream& operator<<(std::ostream& os, const entry& e) {
      return os << '{' << e.key << ": " << e.value << " }";
    }
  };

 private:
  /**
   * One tree node. A leaf stores keys with parallel values and participates
   * in the leaf chain through next. An internal node stores separator keys
   * and exactly keys.size() + 1 children.
   *
   * Ownership runs strictly downwards through children; parent and next are
   * non-owning navigation pointers.
   */
  struct node {
    std::vector<Key> keys;
    std::vector<Value> values;     // leaf only, parallel to keys
    std::vector<node*> children;   // internal only
    node* parent;                  // nullptr for the root
    node* next;                    // next leaf to the right, unused internally
    bool is_leaf;

    explicit node(bool leaf) : parent(nullptr), next(nullptr), is_leaf(leaf) {}

    node(const node&) = delete;
    node& operator=(const node&) = delete;

    /**
     * Index of the first key not less than key (keys.size() if none).
     */
    size_type lower_bound(const Key& key, const Compare& comp) const;

    /**
     * Index of the key equal to key under comp, if present.
     */
    std::optional<size_type> index_of(const Key& key,
                                      const Compare& comp) const;

    /**
     * Inserts key before the first existing key that is not less than it,
     * or at the end. Returns the index the key now occupies.
     *
     * @pre key is not already present
     */
    size_type insert_key_ordered(const Key& key, const Compare& comp);

    /**
     * Associates value with the key at index. Inserts into values when the
     * key at index was just added, otherwise appends.
     *
     * @pre insert_key_ordered() placed a key at index in this insertion
     */
    void set_value_for_key(size_type index, const Value& value);

    /**
     * Position of child within children.
     */
    size_type child_index(const node* child) const;
  };

 public:
  /**
   * Creates an empty map with the default order.
   *
   * @param comp Comparator used for every key ordering decision
   * @param alloc Allocator to use for node allocation
   */
  explicit bplus_tree_map(const Compare& comp = Compare(),
                          const Allocator& alloc = Allocator());

  /**
   * Creates an empty map with the given order.
   *
   * @param order Maximum number of children of an internal node
   * @param comp Comparator used for every key ordering decision
   * @param alloc Allocator to use for node allocation
   * @throws invalid_order_error if order < min_order
   */
  explicit bplus_tree_map(size_type order, const Compare& comp = Compare(),
                          const Allocator& alloc = Allocator());

  /**
   * Destructor - deallocates all nodes.
   */
  ~bplus_tree_map();

  /**
   * Copy constructor - creates a deep copy with the same order and
   * comparator by re-inserting other's entries in key order.
   *
   * Complexity: O(m log m) where m = other.size()
   */
  bplus_tree_map(const bplus_tree_map& other);

  /**
   * Copy assignment operator - replaces contents, order and comparator with
   * a deep copy of other.
   *
   * Complexity: O(n + m log m) where n = this.size(), m = other.size()
   */
  bplus_tree_map& operator=(const bplus_tree_map& other);

  /**
   * Move constructor - takes ownership of another map's nodes.
   * Leaves other empty, keeping its order and comparator.
   * Complexity: O(1)
   */
  bplus_tree_map(bplus_tree_map&& other) noexcept;

  /**
   * Move assignment operator - replaces contents by taking ownership.
   * Leaves other empty.
   * Complexity: O(n) where n is this map's size (due to deallocation)
   */
  bplus_tree_map& operator=(bplus_tree_map&& other) noexcept;

  /**
   * Returns the number of key-value pairs stored.
   * Complexity: O(1)
   */
  [[nodiscard]] size_type size() const { return size_; }

  /**
   * Returns true if the map has no root node.
   * Complexity: O(1)
   */
  [[nodiscard]] bool empty() const { return root_ == nullptr; }

  /**
   * Returns the order (maximum number of children per internal node).
   */
  [[nodiscard]] size_type order() const { return order_; }

  /**
   * Returns a copy of the comparator.
   */
  key_compare key_comp() const { return comp_; }

  /**
   * Returns the allocator associated with the container.
   */
  allocator_type get_allocator() const { return allocator_type(node_alloc_); }

  /**
   * Number of levels from the root down to the leaves (0 when empty).
   *
   * Earlier versions of this container reported this value from size().
   * It is kept under its own name for callers that relied on that.
   *
   * Complexity: O(log n)
   */
  [[nodiscard]] size_type height() const;

  /**
   * Counts entries, leaves and internal nodes by walking the whole tree.
   * Complexity: O(n)
   */
  [[nodiscard]] tree_stats stats() const;

  /**
   * Forward iterator over the leaf chain, yielding entries in ascending key
   * order. Values are read-only through the iterator; use put() to change a
   * mapping.
   *
   * Any put() or clear() invalidates all iterators.
   */
  class const_iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using difference_type = std::ptrdiff_t;
    using value_type = bplus_tree_map::value_type;
    using reference = std::pair<const Key&, const Value&>;

    // operator-> has to hand out the address of a pair of references
    struct arrow_proxy {
      reference ref;
      const reference* operator->() const { return &ref; }
    };
    using pointer = arrow_proxy;

    const_iterator() : leaf_(nullptr), index_(0) {}

    reference operator*() const {
      assert(leaf_ != nullptr && "Dereferencing end iterator");
      return reference(leaf_->keys[index_], leaf_->values[index_]);
    }

    arrow_proxy operator->() const { return arrow_proxy{operator*()}; }

    const_iterator& operator++() {
      assert(leaf_ != nullptr && "Incrementing end iterator");
      ++index_;
      // Leaves are never empty, so stepping into next always lands on an
      // element (or on end() past the rightmost leaf)
      if (index_ == leaf_->keys.size()) {
        leaf_ = leaf_->next;
        index_ = 0;
      }
      return *this;
    }

    const_iterator operator++(int) {
      const_iterator tmp = *this;
      ++(*this);
      return tmp;
    }

    bool operator==(const const_iterator& other) const {
      return leaf_ == other.leaf_ && index_ == other.index_;
    }

    bool operator!=(const const_iterator& other) const {
      return !(*this == other);
    }

   private:
    friend class bplus_tree_map;

    const_iterator(const node* leaf, size_type index)
        : leaf_(leaf), index_(index) {}

    const node* leaf_;
    size_type index_;
  };

  using iterator = const_iterator;

  /**
   * Returns an iterator to the smallest entry.
   * Complexity: O(1) - uses cached leftmost leaf pointer
   */
  const_iterator begin() const { return const_iterator(leftmost_leaf_, 0); }

  /**
   * Returns an iterator to one past the largest entry.
   * Complexity: O(1)
   */
  const_iterator end() const { return const_iterator(); }

  const_iterator cbegin() const { return begin(); }
  const_iterator cend() const { return end(); }

  /**
   * Finds the entry with the given key.
   * Returns an iterator to it if found, end() otherwise.
   * Complexity: O(log n)
   */
  const_iterator find(const Key& key) const;

  /**
   * Returns true if some entry's key compares equal to key. An empty map
   * answers false without searching.
   *
   * Complexity: O(log n)
   */
  bool contains_key(const Key& key) const;

  /**
   * Returns a reference to the value mapped to key.
   *
   * @throws no_such_key_error if no entry has an equal key
   *
   * Complexity: O(log n)
   */
  Value& get(const Key& key);

  /**
   * Returns a const reference to the value mapped to key.
   *
   * @throws no_such_key_error if no entry has an equal key
   *
   * Complexity: O(log n)
   */
  const Value& get(const Key& key) const;

  /**
   * Maps key to value. An existing mapping is overwritten in place without
   * any structural change; otherwise the pair is inserted into its leaf and
   * overflowing nodes are split bottom-up, possibly adding a new root.
   *
   * Every key comparison and every node allocation happens before the tree
   * is modified, so an exception thrown by the comparator or the allocator
   * leaves the map unchanged. This relies on Key and Value having
   * non-throwing moves.
   *
   * @return Reference to the stored value, valid until the next put() or
   *         clear()
   *
   * Complexity: O(log n)
   */
  const Value& put(const Key& key, const Value& value);

  /**
   * Removes all entries and releases every node.
   * All iterators are invalidated.
   *
   * Complexity: O(n)
   */
  void clear();

  /**
   * Returns every key in ascending order. Keys are unique, so the result
   * contains no two keys that compare equal.
   *
   * Complexity: O(n)
   */
  std::vector<Key> key_set() const;

  /**
   * Returns every value, ordered by the ascending order of their keys.
   *
   * Complexity: O(n)
   */
  std::vector<Value> values() const;

  /**
   * Returns a snapshot of every entry in ascending key order.
   *
   * Complexity: O(n)
   */
  std::vector<entry> entry_set() const;

  /**
   * Not supported: the tree is indexed by key only.
   * @throws unsupported_operation_error always
   */
  bool contains_value(const Value& value) const;

  /**
   * Not supported: the tree never shrinks.
   * @throws unsupported_operation_error always
   */
  size_type remove(const Key& key);

  /**
   * Not supported: insert entries one at a time with put().
   * @throws unsupported_operation_error always
   */
  template <typename Map>
  void put_all(const Map& other);

  /**
   * Swaps the contents, order and comparator of this map with another.
   * Complexity: O(1)
   */
  void swap(bplus_tree_map& other) noexcept;

  /**
   * Walks the entire structure and checks the B+ tree invariants: keys
   * strictly ascending in every node, no node holding order() or more keys,
   * internal nodes with keys.size() + 1 children whose keys fall inside the
   * separators' ranges, parent pointers matching child links, all leaves at
   * the same depth, and a leaf chain that visits every entry exactly once in
   * ascending order.
   *
   * @throws invariant_violation describing the first violation found
   *
   * Complexity: O(n)
   */
  void verify() const;

 private:
  using node_allocator =
      typename std::allocator_traits<Allocator>::template rebind_alloc<node>;
  using node_alloc_traits = std::allocator_traits<node_allocator>;

  /**
   * Allocate a new empty node.
   */
  node* allocate_node(bool leaf);

  /**
   * Allocates the right siblings, and a new root if needed, that inserting
   * one more key into leaf will split off. Returns them in the order
   * split_node() consumes them from the back; empty if leaf has room.
   * Nothing is leaked if an allocation throws.
   */
  std::vector<node*> allocate_split_nodes(const node* leaf);

  /**
   * Deallocates unused nodes from allocate_split_nodes() and empties nodes.
   */
  void release_nodes(std::vector<node*>& nodes) noexcept;

  /**
   * Deallocate a single node.
   */
  void deallocate_node(node* n);

  /**
   * Recursively deallocate a node and everything below it.
   */
  void deallocate_subtree(node* n);

  /**
   * Deallocate all nodes and reset to the empty state.
   */
  void deallocate_tree();

  /**
   * Finds the leaf that contains key, or that key would be inserted into.
   * A key equal to a separator is routed to the separator's right child.
   *
   * @throws empty_tree_error if the tree has no root
   */
  node* locate_leaf(const Key& key) const;

  /**
   * Splits a node whose key count has reached the order. The node keeps the
   * lower half and a new right sibling takes the upper half. For a leaf, the
   * first key of the right half is copied up as the separator; for an
   * internal node the middle key moves up and the children are divided
   * around it. Recurses while the parent overflows, and adds a new root when
   * the root itself splits. New nodes are taken from spares, so nothing is
   * allocated here.
   *
   * @pre n->keys.size() == order_
   * @pre spares came from allocate_split_nodes() for this insertion
   */
  void split_node(node* n, std::vector<node*>& spares);

  /**
   * Recursive helper for verify(). Checks the subtree under n against the
   * half-open key range [lower, upper), where a null bound is unbounded.
   */
  void verify_node(const node* n, const Key* lower, const Key* upper,
                   size_type depth, std::optional<size_type>& leaf_depth,
                   std::vector<const node*>& leaves) const;

  // Comparator instance
  [[no_unique_address]] Compare comp_;

  // Node allocator (declared before the root so constructors can use it)
  [[no_unique_address]] node_allocator node_alloc_;

  size_type order_;
  node* root_;
  size_type size_;

  // Cached pointer to the first leaf for O(1) begin(). Splits keep the left
  // half in the original node, so this leaf never changes until clear().
  node* leftmost_leaf_;
};

template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void swap(bplus_tree_map<Key, Value, Compare, Allocator>& lhs,
          bplus_tree_map<Key, Value, Compare, Allocator>& rhs) noexcept {
  lhs.swap(rhs);
}

}  // namespace leafchain

// Include implementation
#include "bplus_tree_map.ipp"
