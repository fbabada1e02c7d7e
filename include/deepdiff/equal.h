// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file equal.h
/// @brief Deep equality test, stops at the first difference.

#pragma once

#include <deepdiff/api.h>
#include <deepdiff/compare.h>

#include <optional>

namespace deepdiff {

class DEEPDIFF_API Equal : public Comparator<Equal, CompareContext> {
public:
    explicit Equal(CompareOptions options = {});

    /// @return true / false, or std::nullopt when nothing was ever compared
    ///         (e.g. two distinct empty containers); treat that as equal
    [[nodiscard]] std::optional<bool> equal(const Value& lhs, const Value& rhs);

    /// The inequality that stopped the comparison, else the first equal outcome
    [[nodiscard]] std::optional<Outcome> outcome(const Value& lhs, const Value& rhs);
};

/// Convenience wrapper around Equal
[[nodiscard]] DEEPDIFF_API std::optional<bool> equal(const Value& lhs, const Value& rhs,
                                                     const CompareOptions& options = {});

/// equal() with the undetermined result counted as equal
[[nodiscard]] DEEPDIFF_API bool deep_equal(const Value& lhs, const Value& rhs,
                                           const CompareOptions& options = {});

} // namespace deepdiff
