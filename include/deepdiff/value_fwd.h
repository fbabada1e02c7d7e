// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_fwd.h
/// @brief Forward declarations for the Value graph types
///
/// Lets headers declare functions taking or returning Value graph types
/// without pulling in value.h (and with it boost::date_time and robin_map).

#pragma once

#include <cstdint>
#include <memory>
#include <vector>

namespace deepdiff {

enum class Kind : std::uint8_t;

struct Value;
class Record;
class ValueMap;
class ValueSet;
class Pattern;
struct BinaryView;

using Sequence   = std::vector<Value>;
using ByteBuffer = std::vector<std::uint8_t>;

using SequencePtr = std::shared_ptr<Sequence>;
using RecordPtr   = std::shared_ptr<Record>;
using MapPtr      = std::shared_ptr<ValueMap>;
using SetPtr      = std::shared_ptr<ValueSet>;
using PatternPtr  = std::shared_ptr<Pattern>;
using ViewPtr     = std::shared_ptr<BinaryView>;
using BufferPtr   = std::shared_ptr<ByteBuffer>;

class Node;
class Change;
struct PathSegment;
using Path = std::vector<PathSegment>;

} // namespace deepdiff
