// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cstddef>
#include <format>
#include <stdexcept>
#include <string>
#include <utility>

namespace leafchain {

/**
 * Thrown at construction when the requested order cannot form a B+ tree.
 * An order below 3 leaves no room for a split to produce two non-empty
 * halves plus a promoted separator.
 */
class invalid_order_error : public std::invalid_argument {
 public:
  invalid_order_error(std::size_t order, std::size_t minimum)
      : std::invalid_argument(
            std::format("bplus_tree_map: order {} is below the minimum of {}",
                        order, minimum)),
        order_(order) {}

  std::size_t order() const noexcept { return order_; }

 private:
  std::size_t order_;
};

/**
 * Thrown by get() when no entry compares equal to the requested key.
 */
class no_such_key_error : public std::out_of_range {
 public:
  using std::out_of_range::out_of_range;
};

/**
 * Thrown unconditionally by the map operations this container does not
 * implement (contains_value, remove, put_all).
 */
class unsupported_operation_error : public std::logic_error {
 public:
  explicit unsupported_operation_error(std::string operation)
      : std::logic_error(std::format(
            "bplus_tree_map::{} is not supported", operation)),
        operation_(std::move(operation)) {}

  const std::string& operation() const noexcept { return operation_; }

 private:
  std::string operation_;
};

/**
 * Thrown when a leaf search is attempted on a tree without a root.
 * Public operations check for emptiness first, so seeing this indicates a
 * bug in the container.
 */
class empty_tree_error : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

/**
 * Thrown by bplus_tree_map::verify() with a description of the first
 * structural invariant found broken.
 */
class invariant_violation : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

}  // namespace leafchain
