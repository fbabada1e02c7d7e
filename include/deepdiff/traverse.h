// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file traverse.h
/// @brief Callback-driven walk over a value graph.
///
/// Usage:
/// @code
///   std::size_t numbers = 0;
///   deepdiff::traverse(root, [&](const deepdiff::Node& node) {
///       if (node.kind() == deepdiff::Kind::Number) ++numbers;
///       return deepdiff::VisitAction::descend();
///   });
/// @endcode

#pragma once

#include <deepdiff/api.h>
#include <deepdiff/visitor.h>

#include <functional>
#include <optional>
#include <vector>

namespace deepdiff {

/// What the traversal does after the callback has seen a node
class DEEPDIFF_API VisitAction {
public:
    enum class Type : std::uint8_t {
        Descend,  ///< Walk the node's own children
        Skip,     ///< Do not walk the children, continue with the next sibling
        Stop,     ///< Abort; traverse() returns the value of this node
        Children  ///< Walk the given values instead of the node's children
    };

    static VisitAction descend() { return VisitAction{Type::Descend}; }

    /// Descend, then call `after` once the children were walked (also on stop)
    static VisitAction descend_then(std::function<void()> after)
    {
        VisitAction action{Type::Descend};
        action.after_ = std::move(after);
        return action;
    }

    static VisitAction skip() { return VisitAction{Type::Skip}; }
    static VisitAction stop() { return VisitAction{Type::Stop}; }

    /// Substitute children; they become child nodes keyed by their index
    static VisitAction children(std::vector<Value> values)
    {
        VisitAction action{Type::Children};
        action.children_ = std::move(values);
        return action;
    }

    [[nodiscard]] Type type() const noexcept { return type_; }
    [[nodiscard]] const std::vector<Value>& explicit_children() const noexcept { return children_; }
    [[nodiscard]] const std::function<void()>& after() const noexcept { return after_; }

private:
    explicit VisitAction(Type type) : type_(type) {}

    Type type_;
    std::vector<Value> children_;
    std::function<void()> after_;
};

using TraverseCallback = std::function<VisitAction(const Node&)>;

struct TraverseContext : VisitContext {
    TraverseCallback callback;
    std::optional<Value> stopped_at;
};

class DEEPDIFF_API Traverse : public Visitor<Traverse, TraverseContext> {
public:
    explicit Traverse(VisitOptions options = {});

    /// Walk `value`, invoking `callback` for every node.
    /// @return the value of the node where the callback stopped, std::nullopt if the walk completed
    std::optional<Value> traverse(const Value& value, TraverseCallback callback);

private:
    friend class Visitor<Traverse, TraverseContext>;

    Flow visit_node(const Node& node, TraverseContext& ctx);
};

/// Convenience wrapper around Traverse
DEEPDIFF_API std::optional<Value> traverse(const Value& value, TraverseCallback callback,
                                           const VisitOptions& options = {});

} // namespace deepdiff
