// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff.h
/// @brief Structural diff producing a replayable list of Changes.
///
/// Diff runs the shared Comparator to completion instead of stopping at the
/// first difference and turns every inequality into a Change:
///
///   outcome      | change | path from | value
///   -------------|--------|-----------|---------------
///   NotEqual     | Edit   | rhs node  | rhs value
///   MissingLeft  | Add    | rhs node  | rhs value
///   MissingRight | Remove | lhs node  | -
///
/// Additions into sequences carry an insert marker so they splice. The
/// changes are ordered so that applying them in sequence to (a copy of) lhs
/// yields a graph deep-equal to rhs.

#pragma once

#include <deepdiff/api.h>
#include <deepdiff/change.h>
#include <deepdiff/compare.h>

#include <optional>
#include <vector>

namespace deepdiff {

struct DiffContext : CompareContext {
    std::vector<Change> changes;
};

class DEEPDIFF_API Diff : public Comparator<Diff, DiffContext> {
public:
    explicit Diff(DiffOptions options = {});

    [[nodiscard]] std::vector<Change> diff(const Value& lhs, const Value& rhs);

private:
    friend class Comparator<Diff, DiffContext>;

    Flow not_equal(DiffContext& ctx, const Node& lhs, const Node& rhs, Outcome outcome);
    Flow no_left(DiffContext& ctx, const Node& rhs);
    Flow no_right(DiffContext& ctx, const Node& lhs);

    /// Root-to-node path; `insert` turns a terminal sequence index into a marker
    [[nodiscard]] Path make_path(const Node& node, bool insert = false) const;

    /// Value stored in a change, cloned when clone_values is set
    [[nodiscard]] Value embed(const Value& value) const;

    std::optional<CloneOptions> clone_values_;
};

/// Convenience wrapper around Diff
[[nodiscard]] DEEPDIFF_API std::vector<Change> diff(const Value& lhs, const Value& rhs,
                                                    const DiffOptions& options = {});

} // namespace deepdiff
