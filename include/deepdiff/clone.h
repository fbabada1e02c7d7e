// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file clone.h
/// @brief Deep copy of a value graph.
///
/// For every node the instantiation strategy manufactures a bare instance,
/// then the cloned children are attached to it:
/// - records:   field set (the enumerable flag is kept)
/// - sequences: slot assignment (the bare sequence is pre-sized)
/// - maps:      key set (keys are shared, not cloned)
/// - sets:      member insert
///
/// With guard_circular_refs every cloned container is remembered, and a
/// container met again attaches its existing clone, so cycles and shared
/// sub-graphs are reproduced in the copy.

#pragma once

#include <deepdiff/api.h>
#include <deepdiff/visitor.h>

#include <tsl/robin_map.h>

#include <vector>

namespace deepdiff {

/// Default leaf instantiation:
/// - immutable scalars (and symbols) are returned as is
/// - containers become an empty instance of the same kind; records keep
///   their type name, sequences are pre-sized
/// - timestamps, patterns and buffers are copy constructed
/// - binary views are sliced into a fresh buffer
[[nodiscard]] DEEPDIFF_API Value default_instantiate(const Node& node);

struct CloneContext : VisitContext {
    /// Clones of the containers currently being filled, innermost last
    std::vector<Value> mirrors;
    /// Original container identity to its clone (circular guard only)
    tsl::robin_map<const void*, Value> clones;
    Value result;
};

class DEEPDIFF_API Clone : public Visitor<Clone, CloneContext, CloneOptions> {
public:
    explicit Clone(CloneOptions options = {});

    [[nodiscard]] Value clone(const Value& value);

private:
    friend class Visitor<Clone, CloneContext, CloneOptions>;

    Flow visit_node(const Node& node, CloneContext& ctx);
    Flow revisit(const Node& node, CloneContext& ctx);

    [[nodiscard]] Value instantiate(const Node& node) const;
    void attach(const Node& node, Value mirror, CloneContext& ctx) const;
};

/// Convenience wrapper around Clone
[[nodiscard]] DEEPDIFF_API Value clone(const Value& value, const CloneOptions& options = {});

} // namespace deepdiff
