// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file property_enum.h
/// @brief Record property enumeration strategies and key filters.
///
/// The engine never decides on its own which fields of a Record are children.
/// It asks a PropertyEnumerator, then passes every key through the optional
/// PropertyFilter. Map, set and sequence children are always taken from the
/// container contents.

#pragma once

#include <deepdiff/api.h>
#include <deepdiff/value_fwd.h>

#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace deepdiff {

/// Returns the keys of a record that the engine will treat as children
using PropertyEnumerator = std::function<std::vector<std::string>(const Record&)>;

/// Return true to keep `key` of the record held by `owner`
using PropertyFilter = std::function<bool(const Node& owner, std::string_view key)>;

/// Enumerable fields in insertion order (default)
[[nodiscard]] DEEPDIFF_API std::vector<std::string> enumerable_keys(const Record& record);

/// Enumerable and non-enumerable fields in insertion order
[[nodiscard]] DEEPDIFF_API std::vector<std::string> all_keys(const Record& record);

/// Enumerable fields in lexicographic order
[[nodiscard]] DEEPDIFF_API std::vector<std::string> sorted_keys(const Record& record);

/// Filter dropping the named keys at every level
[[nodiscard]] DEEPDIFF_API PropertyFilter exclude_keys(std::initializer_list<std::string_view> keys);

/// Filter dropping keys that start with `prefix` (e.g. "_" for private fields)
[[nodiscard]] DEEPDIFF_API PropertyFilter exclude_prefix(std::string prefix);

} // namespace deepdiff
