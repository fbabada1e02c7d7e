// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <deepdiff/change.h>
#include <deepdiff/clone.h>
#include <deepdiff/property_enum.h>

#include <algorithm>
#include <iostream>

namespace deepdiff {

namespace {

using Effect = detail::AppliedChange::Effect;

[[noreturn]] void fail(std::string_view func, const Path& path, std::size_t segment, const std::string& reason)
{
    const auto where = path_to_string(path);
    detail::log_patch_error(func, where, reason);
    throw PatchError("path '" + where + "' segment " + std::to_string(segment) + ": " + reason, path, segment);
}

/// Deep copy used for materialized patches: every field, cycles preserved
Value materialized(const Value& value)
{
    CloneOptions options;
    options.properties = all_keys;
    options.guard_circular_refs = true;
    return clone(value, options);
}

/// Locate a set member by content hash or by position
std::optional<std::size_t> find_member(const ValueSet& set, const SegmentKey& key)
{
    if (const auto* hash = std::get_if<std::string>(&key)) {
        const auto& items = set.items();
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (content_hash(items[i]) == *hash) return i;
        }
        return std::nullopt;
    }
    if (const auto* pos = std::get_if<std::ptrdiff_t>(&key)) {
        if (*pos >= 0 && static_cast<std::size_t>(*pos) < set.size()) {
            return static_cast<std::size_t>(*pos);
        }
        return std::nullopt;
    }
    return std::nullopt;
}

void check_container(const Value& current, const Path& path, std::size_t i)
{
    const auto& segment = path[i];
    if (current.kind() != segment.container) {
        fail("apply", path, i,
             "expected " + std::string{kind_name(segment.container)} + " but found " +
                 std::string{kind_name(current.kind())});
    }

    const bool key_ok = std::visit([&](const auto& key) {
        using T = std::decay_t<decltype(key)>;
        switch (segment.container) {
        case Kind::Record:   return std::is_same_v<T, std::string>;
        case Kind::Sequence: return std::is_same_v<T, std::ptrdiff_t>;
        case Kind::Map:      return std::is_same_v<T, Value>;
        case Kind::Set:      return !std::is_same_v<T, Value>;
        default:             return false;
        }
    }, segment.key);

    if (!key_ok) {
        fail("apply", path, i, "key type does not match " + std::string{kind_name(segment.container)});
    }
}

/// Step from `current` through segment i (not the terminal one)
Value step(const Value& current, const Path& path, std::size_t i)
{
    check_container(current, path, i);
    const auto& key = path[i].key;

    switch (path[i].container) {
    case Kind::Record: {
        const auto& name = std::get<std::string>(key);
        if (const auto* v = current.as_record().find(name)) return *v;
        fail("apply", path, i, "no field '" + name + "'");
    }
    case Kind::Sequence: {
        const auto idx = std::get<std::ptrdiff_t>(key);
        const auto& seq = current.as_sequence();
        if (idx < 0 || static_cast<std::size_t>(idx) >= seq.size()) {
            fail("apply", path, i, "index " + std::to_string(idx) + " out of range");
        }
        return seq[static_cast<std::size_t>(idx)];
    }
    case Kind::Map: {
        const auto& k = std::get<Value>(key);
        if (const auto* v = current.as_map().find(k)) return *v;
        fail("apply", path, i, "no map entry " + value_to_string(k));
    }
    case Kind::Set: {
        const auto& set = current.as_set();
        if (auto pos = find_member(set, key)) return set.at(*pos);
        fail("apply", path, i, "no set member " + segment_to_string(path[i]));
    }
    default:
        fail("apply", path, i, "not a container");
    }
}

/// Validate the terminal operation and describe it, without mutating
detail::AppliedChange plan(const Change& change, const Value& container, Value value)
{
    const auto& path = change.path();
    const auto last = path.size() - 1;
    check_container(container, path, last);

    detail::AppliedChange applied;
    applied.container = container;
    applied.key = path[last].key;
    applied.placed = std::move(value);
    const auto type = change.type();

    switch (path[last].container) {
    case Kind::Record: {
        const auto& name = std::get<std::string>(applied.key);
        const auto& record = container.as_record();
        const auto pos = record.index_of(name);
        if (!pos && type != Change::Type::Add) fail("apply", path, last, "no field '" + name + "'");
        if (pos) {
            const auto& field = record.fields()[*pos];
            applied.position = *pos;
            applied.prior = field.value;
            applied.prior_enumerable = field.enumerable;
            applied.effect = type == Change::Type::Remove ? Effect::Erased : Effect::Replaced;
        } else {
            applied.position = record.size();
            applied.effect = Effect::Inserted;
        }
        break;
    }
    case Kind::Map: {
        const auto& k = std::get<Value>(applied.key);
        const auto& map = container.as_map();
        const auto pos = map.index_of(k);
        if (!pos && type != Change::Type::Add) fail("apply", path, last, "no map entry " + value_to_string(k));
        if (pos) {
            applied.position = *pos;
            applied.prior = map.entries()[*pos].value;
            applied.effect = type == Change::Type::Remove ? Effect::Erased : Effect::Replaced;
        } else {
            applied.position = map.size();
            applied.effect = Effect::Inserted;
        }
        break;
    }
    case Kind::Sequence: {
        const auto idx = std::get<std::ptrdiff_t>(applied.key);
        const auto& seq = container.as_sequence();
        if (is_insert_marker(idx)) {
            if (type != Change::Type::Add) fail("apply", path, last, "insert marker on a non-add change");
            applied.position = std::min(insert_index(idx), seq.size());
            applied.effect = Effect::Inserted;
            break;
        }
        const auto pos = static_cast<std::size_t>(idx);
        if (pos < seq.size()) {
            applied.position = pos;
            applied.prior = seq[pos];
            applied.effect = type == Change::Type::Remove ? Effect::Erased : Effect::Replaced;
        } else if (pos == seq.size() && type == Change::Type::Add) {
            applied.position = pos;
            applied.effect = Effect::Inserted;
        } else {
            fail("apply", path, last, "index " + std::to_string(idx) + " out of range");
        }
        break;
    }
    case Kind::Set: {
        const auto& set = container.as_set();
        if (type == Change::Type::Add) {
            if (set.contains(applied.placed)) {
                applied.effect = Effect::Unchanged;
            } else {
                applied.position = set.size();
                applied.effect = Effect::Inserted;
            }
            break;
        }
        const auto pos = find_member(set, applied.key);
        if (!pos) fail("apply", path, last, "no set member " + segment_to_string(path[last]));
        applied.position = *pos;
        applied.prior = set.at(*pos);
        if (type == Change::Type::Remove) {
            applied.effect = Effect::Erased;
        } else {
            const auto other = set.index_of(applied.placed);
            if (other && *other != *pos) fail("apply", path, last, "replacement is already a member");
            applied.effect = Effect::Replaced;
        }
        break;
    }
    default:
        fail("apply", path, last, "not a container");
    }
    return applied;
}

void perform(detail::AppliedChange& applied)
{
    switch (applied.container.kind()) {
    case Kind::Record: {
        auto& record = applied.container.as_record();
        auto& name = std::get<std::string>(applied.key);
        if (applied.effect == Effect::Erased) {
            record.erase(name);
        } else if (applied.effect == Effect::Replaced) {
            record.set(name, applied.placed);
        } else {
            record.insert_at(applied.position, Record::Field{name, applied.placed, true});
        }
        break;
    }
    case Kind::Map: {
        auto& map = applied.container.as_map();
        const auto& k = std::get<Value>(applied.key);
        if (applied.effect == Effect::Erased) {
            map.erase(k);
        } else {
            map.set(k, applied.placed);
        }
        break;
    }
    case Kind::Sequence: {
        auto& seq = applied.container.as_sequence();
        const auto at = seq.begin() + static_cast<std::ptrdiff_t>(applied.position);
        if (applied.effect == Effect::Erased) {
            seq.erase(at);
        } else if (applied.effect == Effect::Replaced) {
            *at = applied.placed;
        } else {
            seq.insert(at, applied.placed);
        }
        break;
    }
    case Kind::Set: {
        auto& set = applied.container.as_set();
        if (applied.effect == Effect::Erased) {
            set.erase(applied.prior);
        } else if (applied.effect == Effect::Replaced) {
            set.replace_at(applied.position, applied.placed);
        } else if (applied.effect == Effect::Inserted) {
            set.insert(applied.placed);
        }
        break;
    }
    default:
        break;
    }
}

/// Inverse of perform(); checks the slot is still where apply() left it
void restore(const Change& change, detail::AppliedChange& applied)
{
    const auto& path = change.path();
    const auto last = path.size() - 1;
    auto stale = [&](const std::string& reason) { fail("undo", path, last, reason); };

    switch (applied.container.kind()) {
    case Kind::Record: {
        auto& record = applied.container.as_record();
        const auto& name = std::get<std::string>(applied.key);
        if (applied.effect == Effect::Erased) {
            if (record.contains(name)) stale("field '" + name + "' reappeared");
            record.insert_at(applied.position, Record::Field{name, applied.prior, applied.prior_enumerable});
        } else if (applied.effect == Effect::Replaced) {
            if (!record.contains(name)) stale("field '" + name + "' is gone");
            record.set(name, applied.prior, applied.prior_enumerable);
        } else {
            if (!record.erase(name)) stale("field '" + name + "' is gone");
        }
        break;
    }
    case Kind::Map: {
        auto& map = applied.container.as_map();
        const auto& k = std::get<Value>(applied.key);
        if (applied.effect == Effect::Erased) {
            if (map.contains(k)) stale("map entry reappeared");
            map.insert_at(applied.position, ValueMap::Entry{k, applied.prior});
        } else if (applied.effect == Effect::Replaced) {
            if (!map.contains(k)) stale("map entry is gone");
            map.set(k, applied.prior);
        } else {
            if (!map.erase(k)) stale("map entry is gone");
        }
        break;
    }
    case Kind::Sequence: {
        auto& seq = applied.container.as_sequence();
        const auto pos = applied.position;
        if (applied.effect == Effect::Erased) {
            if (pos > seq.size()) stale("index " + std::to_string(pos) + " out of range");
            seq.insert(seq.begin() + static_cast<std::ptrdiff_t>(pos), applied.prior);
        } else {
            if (pos >= seq.size()) stale("index " + std::to_string(pos) + " out of range");
            if (applied.effect == Effect::Replaced) {
                seq[pos] = applied.prior;
            } else {
                seq.erase(seq.begin() + static_cast<std::ptrdiff_t>(pos));
            }
        }
        break;
    }
    case Kind::Set: {
        auto& set = applied.container.as_set();
        if (applied.effect == Effect::Erased) {
            if (!set.insert_at(applied.position, applied.prior)) stale("set member reappeared");
        } else if (applied.effect == Effect::Replaced) {
            const auto pos = set.index_of(applied.placed);
            if (!pos) stale("set member is gone");
            set.replace_at(*pos, applied.prior);
        } else if (applied.effect == Effect::Inserted) {
            if (!set.erase(applied.placed)) stale("set member is gone");
        }
        break;
    }
    default:
        break;
    }
}

} // namespace

// ============================================================
// Change
// ============================================================

std::string_view change_type_name(Change::Type type) noexcept
{
    switch (type) {
    case Change::Type::Add:    return "add";
    case Change::Type::Remove: return "remove";
    case Change::Type::Edit:   return "edit";
    }
    return "unknown";
}

UndoToken Change::apply(Value& target, bool materialize) const
{
    detail::AppliedChange applied;
    Value placed = type_ == Type::Remove ? Value{} : (materialize ? materialized(value_) : value_);

    if (path_.empty()) {
        applied.effect = Effect::Root;
        applied.prior = materialize ? materialized(target) : target;
        applied.placed = std::move(placed);
        target = applied.placed;
        return UndoToken{*this, &target, materialize, std::move(applied)};
    }

    Value current = target;
    for (std::size_t i = 0; i + 1 < path_.size(); ++i) {
        current = step(current, path_, i);
    }

    applied = plan(*this, current, std::move(placed));
    perform(applied);
    if (materialize && applied.effect != Effect::Inserted && applied.effect != Effect::Unchanged) {
        applied.prior = materialized(applied.prior);
    }
    return UndoToken{*this, &target, materialize, std::move(applied)};
}

std::string Change::to_string() const
{
    std::string result{change_type_name(type_)};
    result += " ";
    result += path_to_string(path_);
    if (type_ != Type::Remove) {
        result += " = ";
        result += value_to_string(value_);
    }
    return result;
}

void Change::print_changes(const std::vector<Change>& changes)
{
    std::cout << "=== " << changes.size() << " change(s) ===\n";
    for (const auto& change : changes) {
        std::cout << "  " << change.to_string() << "\n";
    }
}

// ============================================================
// Undo / redo tokens
// ============================================================

bool UndoToken::has_prior() const noexcept
{
    using E = detail::AppliedChange::Effect;
    return applied_.effect == E::Root || applied_.effect == E::Replaced || applied_.effect == E::Erased;
}

RedoToken UndoToken::undo()
{
    if (used_) {
        detail::usage_error("UndoToken::undo", "token already used");
    }

    if (applied_.effect == Effect::Root) {
        *target_ = applied_.prior;
    } else if (applied_.effect != Effect::Unchanged) {
        restore(change_, applied_);
    }
    used_ = true;
    return RedoToken{change_, target_, materialize_};
}

UndoToken RedoToken::redo()
{
    if (used_) {
        detail::usage_error("RedoToken::redo", "token already used");
    }
    auto token = change_.apply(*target_, materialize_);
    used_ = true;
    return token;
}

// ============================================================
// Batches
// ============================================================
//
// Every batch operation is all-or-nothing: on PatchError the steps already
// taken are taken back, the caller's tokens stay usable and the error is
// rethrown. A rollback step that fails itself is logged and skipped.

namespace {

void log_rollback_failure(std::string_view func, const Change& change, const PatchError& error)
{
    detail::log_patch_error(func, path_to_string(change.path()), std::string{"rollback failed: "} + error.what());
}

} // anonymous namespace

std::vector<UndoToken> apply_changes(const std::vector<Change>& changes, Value& target, bool materialize)
{
    std::vector<UndoToken> tokens;
    tokens.reserve(changes.size());
    try {
        for (const auto& change : changes) {
            tokens.push_back(change.apply(target, materialize));
        }
    } catch (const PatchError&) {
        for (auto it = tokens.rbegin(); it != tokens.rend(); ++it) {
            try {
                (void)it->undo();
            } catch (const PatchError& rollback) {
                log_rollback_failure("apply_changes", it->change(), rollback);
            }
        }
        throw;
    }
    return tokens;
}

std::vector<RedoToken> revert_changes(std::vector<UndoToken>& tokens)
{
    // redo[k] belongs to tokens[tokens.size() - 1 - k] until the final reverse
    std::vector<RedoToken> redo;
    redo.reserve(tokens.size());
    try {
        for (auto it = tokens.rbegin(); it != tokens.rend(); ++it) {
            redo.push_back(it->undo());
        }
    } catch (const PatchError&) {
        for (std::size_t k = redo.size(); k-- > 0;) {
            const std::size_t index = tokens.size() - 1 - k;
            try {
                tokens[index] = redo[k].redo();
            } catch (const PatchError& rollback) {
                log_rollback_failure("revert_changes", redo[k].change(), rollback);
            }
        }
        throw;
    }
    std::reverse(redo.begin(), redo.end());
    return redo;
}

std::vector<UndoToken> reapply_changes(std::vector<RedoToken>& tokens)
{
    std::vector<UndoToken> undo;
    undo.reserve(tokens.size());
    try {
        for (auto& token : tokens) {
            undo.push_back(token.redo());
        }
    } catch (const PatchError&) {
        for (std::size_t k = undo.size(); k-- > 0;) {
            try {
                tokens[k] = undo[k].undo();
            } catch (const PatchError& rollback) {
                log_rollback_failure("reapply_changes", undo[k].change(), rollback);
            }
        }
        throw;
    }
    return undo;
}

} // namespace deepdiff
