// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.h
/// @brief Root-to-target addresses used by Change.
///
/// Each segment records the kind of the container it steps into and the key
/// used to reach the next value:
///
///   container | key
///   ----------|------------------------------------------------------------
///   Record    | std::string field name
///   Sequence  | std::ptrdiff_t index; negative = insert marker -(index + 1)
///   Map       | Value map key
///   Set       | std::string content hash of the member, or std::ptrdiff_t
///             | member position under strict set ordering
///
/// Paths carry no identities, so they replay against any structurally equal
/// copy of the graph they were computed on.

#pragma once

#include <deepdiff/api.h>
#include <deepdiff/value.h>

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace deepdiff {

using SegmentKey = std::variant<std::string, std::ptrdiff_t, Value>;

struct PathSegment {
    Kind container;
    SegmentKey key;
};

// Path is declared in value_fwd.h as std::vector<PathSegment>

/// Key of a sequence insertion before `index` (splice instead of overwrite)
[[nodiscard]] constexpr std::ptrdiff_t insert_marker(std::size_t index) noexcept {
    return -static_cast<std::ptrdiff_t>(index) - 1;
}

[[nodiscard]] constexpr bool is_insert_marker(std::ptrdiff_t key) noexcept {
    return key < 0;
}

/// Index encoded by an insert marker
[[nodiscard]] constexpr std::size_t insert_index(std::ptrdiff_t marker) noexcept {
    return static_cast<std::size_t>(-(marker + 1));
}

// ============================================================
// Segment builders
// ============================================================

[[nodiscard]] inline PathSegment field_segment(std::string name) {
    return PathSegment{Kind::Record, SegmentKey{std::move(name)}};
}

[[nodiscard]] inline PathSegment index_segment(std::size_t index) {
    return PathSegment{Kind::Sequence, SegmentKey{static_cast<std::ptrdiff_t>(index)}};
}

[[nodiscard]] inline PathSegment insert_segment(std::size_t index) {
    return PathSegment{Kind::Sequence, SegmentKey{insert_marker(index)}};
}

[[nodiscard]] inline PathSegment map_segment(Value key) {
    return PathSegment{Kind::Map, SegmentKey{std::in_place_type<Value>, std::move(key)}};
}

/// Stable content hash of a value (boost::hash of its canonical string form).
/// Used to address set members, which have no key of their own.
[[nodiscard]] DEEPDIFF_API std::string content_hash(const Value& value);

/// Human readable form, e.g. `.users[0]{"k"}<8812341>`; "/" for the root
[[nodiscard]] DEEPDIFF_API std::string path_to_string(const Path& path);

[[nodiscard]] DEEPDIFF_API std::string segment_to_string(const PathSegment& segment);

/// Set member addressed by content hash
[[nodiscard]] inline PathSegment set_segment(const Value& member) {
    return PathSegment{Kind::Set, SegmentKey{content_hash(member)}};
}

} // namespace deepdiff
