// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <deepdiff/diff.h>
#include <deepdiff/clone.h>

#include <algorithm>

namespace deepdiff {

Diff::Diff(DiffOptions options)
    : Comparator(options)
    , clone_values_(std::move(options.clone_values))
{
}

std::vector<Change> Diff::diff(const Value& lhs, const Value& rhs)
{
    DiffContext ctx;
    Node l{lhs};
    Node r{rhs};
    compare(&l, &r, ctx);
    return std::move(ctx.changes);
}

// ============================================================
// Outcome hooks
// ============================================================

Flow Diff::not_equal(DiffContext& ctx, const Node& lhs, const Node& rhs, Outcome outcome)
{
    if (ctx.searching) {
        return Comparator::not_equal(ctx, lhs, rhs, outcome);
    }
    ctx.changes.push_back(Change::edit(make_path(rhs), embed(rhs.value())));
    record(ctx, outcome);
    return Flow::Continue;
}

Flow Diff::no_left(DiffContext& ctx, const Node& rhs)
{
    if (ctx.searching) {
        return Comparator::no_left(ctx, rhs);
    }
    ctx.changes.push_back(Change::add(make_path(rhs, true), embed(rhs.value())));
    record(ctx, Outcome::MissingLeft);
    return Flow::Continue;
}

Flow Diff::no_right(DiffContext& ctx, const Node& lhs)
{
    if (ctx.searching) {
        return Comparator::no_right(ctx, lhs);
    }
    ctx.changes.push_back(Change::remove(make_path(lhs)));
    record(ctx, Outcome::MissingRight);
    return Flow::Continue;
}

// ============================================================
// Helpers
// ============================================================

Path Diff::make_path(const Node& node, bool insert) const
{
    Path path;
    for (const Node* n = &node; !n->is_root(); n = n->parent()) {
        const Kind container = n->parent()->kind();
        switch (container) {
        case Kind::Record:
            path.push_back(field_segment(*n->key_name()));
            break;
        case Kind::Sequence: {
            const auto index = n->key_index().value_or(0);
            path.push_back(insert && n == &node ? insert_segment(index) : index_segment(index));
            break;
        }
        case Kind::Map:
            path.push_back(map_segment(std::get<Value>(n->key())));
            break;
        case Kind::Set:
            if (options().strict_set_ordering && n->position()) {
                path.push_back(PathSegment{Kind::Set, SegmentKey{static_cast<std::ptrdiff_t>(*n->position())}});
            } else {
                path.push_back(set_segment(n->value()));
            }
            break;
        default:
            break;
        }
    }
    std::reverse(path.begin(), path.end());
    return path;
}

Value Diff::embed(const Value& value) const
{
    if (!clone_values_) return value;
    return Clone{*clone_values_}.clone(value);
}

std::vector<Change> diff(const Value& lhs, const Value& rhs, const DiffOptions& options)
{
    return Diff{options}.diff(lhs, rhs);
}

} // namespace deepdiff
