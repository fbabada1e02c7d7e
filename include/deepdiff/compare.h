// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file compare.h
/// @brief Dual-graph comparator shared by equal() and diff().
///
/// Comparator walks two graphs in lockstep. Every step receives an explicit
/// (lhs, rhs) pair of nodes, either of which may be absent, and classifies it:
///
///   1. both absent                -> Identical
///      one absent                 -> MissingLeft / MissingRight
///   2. positions differ           -> NotEqual
///   3. same identity              -> Identical (no descent)
///   4. kinds differ               -> loose equality (opt-in) may give Equivalent,
///                                    an undefined side gives MissingLeft / MissingRight,
///                                    anything else NotEqual
///   5. same container kind        -> per-kind pairing of the children
///   6. same leaf kind             -> per-kind leaf rule
///
/// Steps 5 and 6 run through the Visitor base: its circular guard keys on the
/// (lhs, rhs) identity pair and its kind dispatch lands in the visit_* hooks.
///
/// What happens on each outcome is decided by the Derived hooks
/// are_equal / not_equal / no_left / no_right. The defaults record the
/// outcome in the context and stop on the first inequality (equality testing).
///
/// Lax sequence ordering pairs each lhs element with the first unconsumed rhs
/// element of the same kind that compares equal. Candidates are probed with a
/// "search" comparison which records into CompareContext::search_result and
/// leaves the enclosing result and circular-reference state untouched.

#pragma once

#include <deepdiff/node.h>
#include <deepdiff/options.h>
#include <deepdiff/value.h>
#include <deepdiff/visitor.h>

#include <boost/container_hash/hash.hpp>
#include <tsl/robin_set.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <locale>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace deepdiff {

// ============================================================
// Outcome
// ============================================================

enum class Outcome : std::uint8_t {
    Identical,    ///< Same identity
    Equivalent,   ///< Equal but distinct
    NotEqual,
    MissingLeft,  ///< Only the rhs has a value
    MissingRight  ///< Only the lhs has a value
};

[[nodiscard]] constexpr bool is_equal(Outcome outcome) noexcept {
    return outcome == Outcome::Identical || outcome == Outcome::Equivalent;
}

[[nodiscard]] DEEPDIFF_API std::string_view outcome_name(Outcome outcome) noexcept;

// ============================================================
// CompareContext
// ============================================================

using IdentityPair = std::pair<const void*, const void*>;

struct IdentityPairHash {
    [[nodiscard]] std::size_t operator()(const IdentityPair& p) const noexcept {
        std::size_t seed = 0;
        boost::hash_combine(seed, p.first);
        boost::hash_combine(seed, p.second);
        return seed;
    }
};

using IdentityPairSet = tsl::robin_set<IdentityPair, IdentityPairHash>;

struct CompareContext {
    /// rhs node paired with the lhs node being visited
    const Node* counterpart = nullptr;
    /// Outcome of the comparison so far (unset until something was compared)
    std::optional<Outcome> result;
    /// True while probing lax-ordering candidates
    bool searching = false;
    /// Outcome of the current probe
    std::optional<Outcome> search_result;
    /// (lhs, rhs) container pairs already entered (circular guard)
    IdentityPairSet refs;
};

// ============================================================
// Comparator
// ============================================================

/// Pairwise Visitor: the lhs node travels through Visitor::visit() and the
/// per-kind hooks, the rhs node rides along as CompareContext::counterpart.
template <typename Derived, typename Context>
class Comparator : public Visitor<Derived, Context, CompareOptions> {
    using Base = Visitor<Derived, Context, CompareOptions>;

public:
    explicit Comparator(CompareOptions options) : Base(std::move(options)) {}

    using Base::options;

    /// Compare a node pair; nullptr stands for an absent counterpart
    Flow compare(const Node* lhs, const Node* rhs, Context& ctx)
    {
        if (!lhs) {
            if (rhs) return derived().no_left(ctx, *rhs);
            return derived().are_equal(ctx, lhs, rhs, Outcome::Identical);
        }
        if (!rhs) {
            return derived().no_right(ctx, *lhs);
        }
        if (lhs->position() != rhs->position()) {
            return derived().not_equal(ctx, *lhs, *rhs, Outcome::NotEqual);
        }
        if (same_value(lhs->value(), rhs->value())) {
            return derived().are_equal(ctx, lhs, rhs, Outcome::Identical);
        }

        const Kind lk = lhs->kind();
        const Kind rk = rhs->kind();
        if (lk == rk) {
            return visit_pair(*lhs, *rhs, ctx);
        }
        if (options().loose_equality && loosely_equal(lhs->value(), rhs->value())) {
            return derived().are_equal(ctx, lhs, rhs, Outcome::Equivalent);
        }
        if (lk == Kind::Undefined) {
            return derived().no_left(ctx, *rhs);
        }
        if (rk == Kind::Undefined) {
            return derived().no_right(ctx, *lhs);
        }
        return derived().not_equal(ctx, *lhs, *rhs, Outcome::NotEqual);
    }

protected:
    friend Base;

    using Base::derived;

    // ------------------------------------------------------------
    // Outcome hooks (shadow in Derived)
    // ------------------------------------------------------------

    /// The first equal outcome wins; later ones never overwrite it
    Flow are_equal(Context& ctx, const Node*, const Node*, Outcome outcome)
    {
        if (ctx.searching) {
            if (!ctx.search_result) ctx.search_result = outcome;
        } else if (!ctx.result) {
            ctx.result = outcome;
        }
        return Flow::Continue;
    }

    Flow not_equal(Context& ctx, const Node&, const Node&, Outcome outcome)
    {
        record(ctx, outcome);
        return Flow::Stop;
    }

    Flow no_left(Context& ctx, const Node&)
    {
        record(ctx, Outcome::MissingLeft);
        return Flow::Stop;
    }

    Flow no_right(Context& ctx, const Node&)
    {
        record(ctx, Outcome::MissingRight);
        return Flow::Stop;
    }

    /// Overwrite the result (or search result while searching)
    static void record(Context& ctx, Outcome outcome) noexcept
    {
        if (ctx.searching) {
            ctx.search_result = outcome;
        } else {
            ctx.result = outcome;
        }
    }

    // ------------------------------------------------------------
    // Same-kind pairs through the Visitor hooks
    // ------------------------------------------------------------

    /// Visit `lhs` with `rhs` as its counterpart
    Flow visit_pair(const Node& lhs, const Node& rhs, Context& ctx)
    {
        const Node* outer = ctx.counterpart;
        ctx.counterpart = &rhs;
        const Flow flow = this->visit(lhs, ctx);
        ctx.counterpart = outer;
        return flow;
    }

    /// A pair already entered was compared before or is still in progress above
    bool enter(const Node& lhs, Context& ctx)
    {
        return ctx.refs.emplace(lhs.value().identity(), ctx.counterpart->value().identity()).second;
    }

    Flow visit_record(const Node& lhs, Context& ctx) { return derived().compare_records(lhs, *ctx.counterpart, ctx); }
    Flow visit_map(const Node& lhs, Context& ctx) { return derived().compare_maps(lhs, *ctx.counterpart, ctx); }
    Flow visit_set(const Node& lhs, Context& ctx) { return derived().compare_sets(lhs, *ctx.counterpart, ctx); }
    Flow visit_sequence(const Node& lhs, Context& ctx) { return derived().compare_sequences(lhs, *ctx.counterpart, ctx); }
    Flow visit_other(const Node& lhs, Context& ctx) { return derived().compare_leaves(lhs, *ctx.counterpart, ctx); }

    // ------------------------------------------------------------
    // Leaves
    // ------------------------------------------------------------

    Flow compare_leaves(const Node& lhs, const Node& rhs, Context& ctx)
    {
        const Outcome outcome = leaf_outcome(lhs.value(), rhs.value(), lhs.kind());
        if (is_equal(outcome)) {
            return derived().are_equal(ctx, &lhs, &rhs, outcome);
        }
        return derived().not_equal(ctx, lhs, rhs, outcome);
    }

    [[nodiscard]] Outcome leaf_outcome(const Value& a, const Value& b, Kind kind) const
    {
        auto equivalent_if = [](bool eq) { return eq ? Outcome::Equivalent : Outcome::NotEqual; };

        switch (kind) {
        case Kind::String: {
            const auto& x = a.as<std::string>();
            const auto& y = b.as<std::string>();
            const auto& coll = std::use_facet<std::collate<char>>(options().locale);
            return equivalent_if(coll.compare(x.data(), x.data() + x.size(), y.data(), y.data() + y.size()) == 0);
        }
        case Kind::Number: {
            const double x = a.as<double>();
            const double y = b.as<double>();
            const bool xnan = std::isnan(x);
            const bool ynan = std::isnan(y);
            if (xnan || ynan) return equivalent_if(xnan && ynan);
            return equivalent_if(std::fabs(x - y) < options().epsilon);
        }
        case Kind::Timestamp:
            return equivalent_if(a.as_timestamp() == b.as_timestamp());
        case Kind::Pattern:
            return equivalent_if(a.as_pattern().to_string() == b.as_pattern().to_string());
        case Kind::BinaryView: {
            const auto& x = a.as_view();
            const auto& y = b.as_view();
            if (x.length != y.length) return Outcome::NotEqual;
            if (x.buffer == y.buffer && x.offset == y.offset) return Outcome::Equivalent;
            auto xb = x.bytes();
            auto yb = y.bytes();
            return equivalent_if(std::equal(xb.begin(), xb.end(), yb.begin(), yb.end()));
        }
        case Kind::BinaryBuffer:
            return equivalent_if(a.as_buffer() == b.as_buffer());
        default:
            if (same_value(a, b)) return Outcome::Identical;
            if (options().loose_equality && loosely_equal(a, b)) return Outcome::Equivalent;
            return equivalent_if(same_value_zero(a, b));
        }
    }

    // ------------------------------------------------------------
    // Records: removed keys, added keys, then shared keys
    // ------------------------------------------------------------

    Flow compare_records(const Node& lhs, const Node& rhs, Context& ctx)
    {
        const auto& lrec = lhs.value().as_record();
        const auto& rrec = rhs.value().as_record();
        const auto& lkeys = lhs.properties(options().properties, options().prop_filter);
        const auto& rkeys = rhs.properties(options().properties, options().prop_filter);

        tsl::robin_set<std::string_view> lset;
        tsl::robin_set<std::string_view> rset;
        for (const auto& key : lkeys) lset.insert(key);
        for (const auto& key : rkeys) rset.insert(key);

        auto field_value = [](const Record& rec, const std::string& key) {
            const Value* v = rec.find(key);
            return v ? *v : Value{};
        };

        for (const auto& key : lkeys) {
            if (rset.count(key) != 0) continue;
            Node child{field_value(lrec, key), &lhs, key};
            if (derived().no_right(ctx, child) == Flow::Stop) return Flow::Stop;
        }
        for (const auto& key : rkeys) {
            if (lset.count(key) != 0) continue;
            Node child{field_value(rrec, key), &rhs, key};
            if (derived().no_left(ctx, child) == Flow::Stop) return Flow::Stop;
        }
        for (const auto& key : lkeys) {
            if (rset.count(key) == 0) continue;
            // Field order never matters: no position
            Node l{field_value(lrec, key), &lhs, key};
            Node r{field_value(rrec, key), &rhs, key};
            if (compare(&l, &r, ctx) == Flow::Stop) return Flow::Stop;
        }
        return Flow::Continue;
    }

    // ------------------------------------------------------------
    // Maps: removed keys, added keys, then shared keys
    // ------------------------------------------------------------

    Flow compare_maps(const Node& lhs, const Node& rhs, Context& ctx)
    {
        const auto& lmap = lhs.value().as_map();
        const auto& rmap = rhs.value().as_map();

        std::vector<const ValueMap::Entry*> shared;
        std::vector<const ValueMap::Entry*> removed;
        std::vector<const ValueMap::Entry*> added;
        for (const auto& entry : lmap.entries()) {
            (rmap.contains(entry.key) ? shared : removed).push_back(&entry);
        }
        for (const auto& entry : rmap.entries()) {
            if (!lmap.contains(entry.key)) added.push_back(&entry);
        }

        // Strict ordering only holds while membership is identical
        const bool strict = options().strict_map_ordering && removed.empty() && added.empty();
        if (strict && !same_order(lmap.entries(), rmap.entries(),
                                  [](const ValueMap::Entry& e) -> const Value& { return e.key; })) {
            return derived().not_equal(ctx, lhs, rhs, Outcome::NotEqual);
        }

        for (const auto* entry : removed) {
            Node child{entry->value, &lhs, entry->key};
            if (derived().no_right(ctx, child) == Flow::Stop) return Flow::Stop;
        }
        for (const auto* entry : added) {
            Node child{entry->value, &rhs, entry->key};
            if (derived().no_left(ctx, child) == Flow::Stop) return Flow::Stop;
        }
        for (std::size_t i = 0; i < shared.size(); ++i) {
            const auto* entry = shared[i];
            const auto position = strict ? std::optional<std::size_t>{i} : std::nullopt;
            Node l{entry->value, &lhs, entry->key, position};
            Node r{*rmap.find(entry->key), &rhs, entry->key, position};
            if (compare(&l, &r, ctx) == Flow::Stop) return Flow::Stop;
        }
        return Flow::Continue;
    }

    // ------------------------------------------------------------
    // Sets: removed members, added members, then shared members tail-first
    // ------------------------------------------------------------

    Flow compare_sets(const Node& lhs, const Node& rhs, Context& ctx)
    {
        const auto& lset = lhs.value().as_set();
        const auto& rset = rhs.value().as_set();

        std::vector<const Value*> shared;
        std::vector<const Value*> removed;
        std::vector<const Value*> added;
        for (const auto& item : lset.items()) {
            (rset.contains(item) ? shared : removed).push_back(&item);
        }
        for (const auto& item : rset.items()) {
            if (!lset.contains(item)) added.push_back(&item);
        }

        const bool strict = options().strict_set_ordering && removed.empty() && added.empty();
        if (strict && !same_order(lset.items(), rset.items(), [](const Value& v) -> const Value& { return v; })) {
            return derived().not_equal(ctx, lhs, rhs, Outcome::NotEqual);
        }

        for (const auto* item : removed) {
            Node child{*item, &lhs, std::monostate{}};
            if (derived().no_right(ctx, child) == Flow::Stop) return Flow::Stop;
        }
        for (const auto* item : added) {
            Node child{*item, &rhs, std::monostate{}};
            if (derived().no_left(ctx, child) == Flow::Stop) return Flow::Stop;
        }
        // Re-keying a member removes and re-appends it, so walk from the tail
        for (std::size_t i = shared.size(); i-- > 0;) {
            const auto position = strict ? std::optional<std::size_t>{i} : std::nullopt;
            const Value& rv = rset.items()[*rset.index_of(*shared[i])];
            Node l{*shared[i], &lhs, std::monostate{}, position};
            Node r{rv, &rhs, std::monostate{}, position};
            if (compare(&l, &r, ctx) == Flow::Stop) return Flow::Stop;
        }
        return Flow::Continue;
    }

    // ------------------------------------------------------------
    // Sequences
    // ------------------------------------------------------------

    Flow compare_sequences(const Node& lhs, const Node& rhs, Context& ctx)
    {
        const bool lax = options().lax_array_ordering;
        auto lelems = elements_of(lhs, lax);
        auto relems = elements_of(rhs, lax);

        if (!lax) {
            // Edits and removals tail first, so none shifts an index still to
            // be visited; then additions head first, each appending in place
            for (std::size_t i = lelems.size(); i-- > 0;) {
                const Node* r = i < relems.size() ? &relems[i] : nullptr;
                if (compare(&lelems[i], r, ctx) == Flow::Stop) return Flow::Stop;
            }
            for (std::size_t i = lelems.size(); i < relems.size(); ++i) {
                if (compare(nullptr, &relems[i], ctx) == Flow::Stop) return Flow::Stop;
            }
            return Flow::Continue;
        }

        std::vector<bool> consumed(relems.size(), false);
        std::vector<std::pair<std::size_t, std::size_t>> shared;
        std::vector<std::size_t> removed;

        for (std::size_t i = 0; i < lelems.size(); ++i) {
            if (auto j = find_match(lelems[i], relems, consumed, ctx)) {
                consumed[*j] = true;
                shared.emplace_back(i, *j);
            } else {
                removed.push_back(i);
            }
        }

        // Shared pairs and removals by descending lhs index, then additions
        // by ascending rhs index so each lands at its final position
        for (auto it = shared.rbegin(); it != shared.rend(); ++it) {
            if (compare(&lelems[it->first], &relems[it->second], ctx) == Flow::Stop) return Flow::Stop;
        }
        for (auto it = removed.rbegin(); it != removed.rend(); ++it) {
            if (derived().no_right(ctx, lelems[*it]) == Flow::Stop) return Flow::Stop;
        }
        for (std::size_t j = 0; j < relems.size(); ++j) {
            if (consumed[j]) continue;
            if (derived().no_left(ctx, relems[j]) == Flow::Stop) return Flow::Stop;
        }
        return Flow::Continue;
    }

    /// First unconsumed candidate of the same kind that compares equal
    std::optional<std::size_t> find_match(const Node& elem, const std::vector<Node>& candidates,
                                          const std::vector<bool>& consumed, Context& ctx)
    {
        for (std::size_t j = 0; j < candidates.size(); ++j) {
            if (consumed[j] || candidates[j].kind() != elem.kind()) continue;

            SearchScope scope{ctx};
            compare(&elem, &candidates[j], ctx);
            // A probe that recorded nothing (e.g. two empty containers) is a match
            if (!ctx.search_result || is_equal(*ctx.search_result)) {
                return j;
            }
        }
        return std::nullopt;
    }

private:
    /// Saves and restores the search state and circular guard around a probe
    class SearchScope {
    public:
        explicit SearchScope(Context& ctx)
            : ctx_(ctx)
            , searching_(ctx.searching)
            , search_result_(ctx.search_result)
            , refs_(ctx.refs)
        {
            ctx_.searching = true;
            ctx_.search_result.reset();
        }

        ~SearchScope()
        {
            ctx_.searching = searching_;
            ctx_.search_result = search_result_;
            ctx_.refs = std::move(refs_);
        }

        SearchScope(const SearchScope&) = delete;
        SearchScope& operator=(const SearchScope&) = delete;

    private:
        Context& ctx_;
        bool searching_;
        std::optional<Outcome> search_result_;
        IdentityPairSet refs_;
    };

    [[nodiscard]] static std::vector<Node> elements_of(const Node& node, bool lax)
    {
        const auto& seq = node.value().as_sequence();
        std::vector<Node> elems;
        elems.reserve(seq.size());
        for (std::size_t i = 0; i < seq.size(); ++i) {
            elems.emplace_back(seq[i], &node, i, lax ? std::nullopt : std::optional<std::size_t>{i});
        }
        return elems;
    }

    template <typename Item, typename KeyOf>
    [[nodiscard]] static bool same_order(const std::vector<Item>& a, const std::vector<Item>& b, KeyOf key_of)
    {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (!same_value_zero(key_of(a[i]), key_of(b[i]))) return false;
        }
        return true;
    }

};

} // namespace deepdiff
