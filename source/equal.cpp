// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <deepdiff/equal.h>

namespace deepdiff {

std::string_view outcome_name(Outcome outcome) noexcept
{
    switch (outcome) {
    case Outcome::Identical:    return "identical";
    case Outcome::Equivalent:   return "equivalent";
    case Outcome::NotEqual:     return "not-equal";
    case Outcome::MissingLeft:  return "missing-left";
    case Outcome::MissingRight: return "missing-right";
    }
    return "unknown";
}

Equal::Equal(CompareOptions options)
    : Comparator(std::move(options))
{
}

std::optional<Outcome> Equal::outcome(const Value& lhs, const Value& rhs)
{
    CompareContext ctx;
    Node l{lhs};
    Node r{rhs};
    compare(&l, &r, ctx);
    return ctx.result;
}

std::optional<bool> Equal::equal(const Value& lhs, const Value& rhs)
{
    if (auto result = outcome(lhs, rhs)) {
        return is_equal(*result);
    }
    return std::nullopt;
}

std::optional<bool> equal(const Value& lhs, const Value& rhs, const CompareOptions& options)
{
    return Equal{options}.equal(lhs, rhs);
}

bool deep_equal(const Value& lhs, const Value& rhs, const CompareOptions& options)
{
    return equal(lhs, rhs, options).value_or(true);
}

} // namespace deepdiff
