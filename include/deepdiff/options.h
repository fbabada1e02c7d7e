// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file options.h
/// @brief Runtime options for traverse, equal, diff and clone.
///
/// Options are plain aggregates; set the fields you need:
/// @code
///   deepdiff::DiffOptions opts;
///   opts.lax_array_ordering = true;
///   opts.prop_filter = deepdiff::exclude_keys({"updated_at"});
///   auto changes = deepdiff::diff(a, b, opts);
/// @endcode

#pragma once

#include <deepdiff/property_enum.h>
#include <deepdiff/value.h>

#include <functional>
#include <limits>
#include <locale>
#include <optional>

namespace deepdiff {

/// Manufactures the bare instance a node is cloned into (see default_instantiate)
using InstantiateFn = std::function<Value(const Node&)>;

struct VisitOptions {
    /// Which record fields are children (default: enumerable fields)
    PropertyEnumerator properties = enumerable_keys;
    /// Optional key filter applied after `properties`
    PropertyFilter prop_filter;
    /// Track visited containers so cyclic graphs terminate
    bool guard_circular_refs = false;
};

struct CompareOptions : VisitOptions {
    /// Compare values of different kinds with relaxed equality (null ~ undefined, "1" ~ 1, ...)
    bool loose_equality = false;
    /// Numbers closer than this are equivalent
    double epsilon = std::numeric_limits<double>::epsilon();
    /// Sequences are equal if they hold the same elements in any order
    bool lax_array_ordering = false;
    /// Map insertion order matters when both maps hold the same keys
    bool strict_map_ordering = false;
    /// Set insertion order matters when both sets hold the same members
    bool strict_set_ordering = false;
    /// Collation used for string comparison
    std::locale locale{};
};

struct CloneOptions : VisitOptions {
    /// Leaf instantiation strategy; empty means default_instantiate
    InstantiateFn instantiate;
};

struct DiffOptions : CompareOptions {
    /// When set, right-hand values are deep-cloned with these options before
    /// they are stored in Add/Edit changes
    std::optional<CloneOptions> clone_values;
};

} // namespace deepdiff
