// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file visitor.h
/// @brief Traversal framework shared by traverse, clone and the comparator.
///
/// Visitor is a CRTP base. Every node enters through visit(), which applies the
/// optional circular-reference guard (Derived::enter / Derived::revisit) and
/// hands the node to Derived::visit_node().
/// The default visit_node() dispatches on the node kind to one of
/// visit_record / visit_map / visit_set / visit_sequence / visit_other; the
/// container hooks build one child Node per child and recurse through
/// visit_children(). A Derived class shadows only the hooks it cares about
/// and befriends the base so the hooks can stay non-public.
///
/// All mutable state lives in the Context passed by reference; algorithm
/// objects only hold their options, so one instance can serve many calls.

#pragma once

#include <deepdiff/node.h>
#include <deepdiff/options.h>
#include <deepdiff/value.h>

#include <tsl/robin_set.h>

#include <cstdint>
#include <vector>

namespace deepdiff {

/// Result of every hook: keep going, or abort the whole traversal
enum class Flow : std::uint8_t { Continue, Stop };

/// Identities of containers already entered
using IdentitySet = tsl::robin_set<const void*>;

/// Minimal context for single-graph traversal
struct VisitContext {
    IdentitySet refs;
};

template <typename Derived, typename Context, typename Options = VisitOptions>
class Visitor {
public:
    explicit Visitor(Options options) : options_(std::move(options)) {}

    [[nodiscard]] const Options& options() const noexcept { return options_; }

    /// Entry point for every node
    Flow visit(const Node& node, Context& ctx)
    {
        if (options_.guard_circular_refs && is_container(node.kind())) {
            if (!derived().enter(node, ctx)) {
                return derived().revisit(node, ctx);
            }
        }
        return derived().visit_node(node, ctx);
    }

protected:
    Derived& derived() noexcept { return static_cast<Derived&>(*this); }

    // ------------------------------------------------------------
    // Hooks (shadow in Derived)
    // ------------------------------------------------------------

    Flow visit_node(const Node& node, Context& ctx) { return dispatch(node, ctx); }

    /// Mark a container as entered; false if it was entered before
    bool enter(const Node& node, Context& ctx) { return ctx.refs.insert(node.value().identity()).second; }

    /// Called instead of visit_node() for an already entered container
    Flow revisit(const Node&, Context&) { return Flow::Continue; }

    Flow visit_record(const Node& node, Context& ctx)
    {
        auto children = children_of(node);
        return derived().visit_children(node, children, ctx);
    }

    Flow visit_map(const Node& node, Context& ctx)
    {
        auto children = children_of(node);
        return derived().visit_children(node, children, ctx);
    }

    Flow visit_set(const Node& node, Context& ctx)
    {
        auto children = children_of(node);
        return derived().visit_children(node, children, ctx);
    }

    Flow visit_sequence(const Node& node, Context& ctx)
    {
        auto children = children_of(node);
        return derived().visit_children(node, children, ctx);
    }

    Flow visit_other(const Node&, Context&) { return Flow::Continue; }

    Flow visit_children(const Node&, const std::vector<Node>& children, Context& ctx)
    {
        for (const auto& child : children) {
            if (derived().visit(child, ctx) == Flow::Stop) {
                return Flow::Stop;
            }
        }
        return Flow::Continue;
    }

    // ------------------------------------------------------------
    // Helpers
    // ------------------------------------------------------------

    /// Route a node to its per-kind hook
    Flow dispatch(const Node& node, Context& ctx)
    {
        switch (node.kind()) {
        case Kind::Record:   return derived().visit_record(node, ctx);
        case Kind::Map:      return derived().visit_map(node, ctx);
        case Kind::Set:      return derived().visit_set(node, ctx);
        case Kind::Sequence: return derived().visit_sequence(node, ctx);
        default:             return derived().visit_other(node, ctx);
        }
    }

    /// One child node per child of a container, each pointing back at `node`.
    /// Record children come from the property enumerator and filter; the
    /// position of every child is its ordinal in that enumeration.
    [[nodiscard]] std::vector<Node> children_of(const Node& node) const
    {
        std::vector<Node> children;
        const Value& v = node.value();

        switch (node.kind()) {
        case Kind::Record: {
            const auto& rec = v.as_record();
            const auto& keys = node.properties(options_.properties, options_.prop_filter);
            children.reserve(keys.size());
            for (std::size_t i = 0; i < keys.size(); ++i) {
                const Value* child = rec.find(keys[i]);
                children.emplace_back(child ? *child : Value{}, &node, keys[i], i);
            }
            break;
        }
        case Kind::Map: {
            const auto& entries = v.as_map().entries();
            children.reserve(entries.size());
            for (std::size_t i = 0; i < entries.size(); ++i) {
                children.emplace_back(entries[i].value, &node, entries[i].key, i);
            }
            break;
        }
        case Kind::Set: {
            const auto& items = v.as_set().items();
            children.reserve(items.size());
            for (std::size_t i = 0; i < items.size(); ++i) {
                children.emplace_back(items[i], &node, std::monostate{}, i);
            }
            break;
        }
        case Kind::Sequence: {
            const auto& seq = v.as_sequence();
            children.reserve(seq.size());
            for (std::size_t i = 0; i < seq.size(); ++i) {
                children.emplace_back(seq[i], &node, i, i);
            }
            break;
        }
        default:
            break;
        }
        return children;
    }

private:
    Options options_;
};

} // namespace deepdiff
