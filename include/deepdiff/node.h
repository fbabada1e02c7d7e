// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file node.h
/// @brief Traversal-time wrapper around one value of a graph.
///
/// A Node carries the value plus where it sits in its parent: the parent node,
/// the key used to reach it and its ordinal position. Kind and record
/// properties are computed on first use and cached for the life of the node.
/// Nodes live on the stack of one traversal and are never reused.

#pragma once

#include <deepdiff/api.h>
#include <deepdiff/property_enum.h>
#include <deepdiff/value.h>

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace deepdiff {

/// How a parent reaches a node:
/// - std::monostate: root, or set member
/// - std::string:    record field name
/// - std::size_t:    sequence index
/// - Value:          map key
using NodeKey = std::variant<std::monostate, std::string, std::size_t, Value>;

class DEEPDIFF_API Node {
public:
    /// Root node
    explicit Node(Value value) : value_(std::move(value)) {}

    Node(Value value, const Node* parent, NodeKey key, std::optional<std::size_t> position = std::nullopt)
        : value_(std::move(value))
        , parent_(parent)
        , key_(std::move(key))
        , position_(position)
    {}

    [[nodiscard]] const Value& value() const noexcept { return value_; }

    /// Classified kind, computed once
    [[nodiscard]] Kind kind() const noexcept
    {
        if (!kind_) kind_ = value_.kind();
        return *kind_;
    }

    [[nodiscard]] const Node* parent() const noexcept { return parent_; }
    [[nodiscard]] bool is_root() const noexcept { return parent_ == nullptr; }
    [[nodiscard]] const NodeKey& key() const noexcept { return key_; }
    [[nodiscard]] std::optional<std::size_t> position() const noexcept { return position_; }

    /// Field name if this node is a record field
    [[nodiscard]] const std::string* key_name() const noexcept { return std::get_if<std::string>(&key_); }

    /// Index if this node is a sequence element
    [[nodiscard]] std::optional<std::size_t> key_index() const noexcept
    {
        if (auto* i = std::get_if<std::size_t>(&key_)) return *i;
        return std::nullopt;
    }

    /// Number of ancestors
    [[nodiscard]] std::size_t depth() const noexcept;

    /// Child keys of a record node, from `enumerate` then `filter`; computed once.
    /// Empty for every other kind.
    [[nodiscard]] const std::vector<std::string>& properties(const PropertyEnumerator& enumerate,
                                                             const PropertyFilter& filter) const;

private:
    Value value_;
    const Node* parent_ = nullptr;
    NodeKey key_;
    std::optional<std::size_t> position_;

    mutable std::optional<Kind> kind_;
    mutable std::optional<std::vector<std::string>> properties_;
};

} // namespace deepdiff
