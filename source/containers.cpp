// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <deepdiff/value.h>

#include <algorithm>

namespace deepdiff {

// ============================================================
// Record
// ============================================================

bool Record::contains(std::string_view key) const
{
    // Heterogeneous lookup via transparent hash - no allocation
    return index_.find(key) != index_.end();
}

Value* Record::find(std::string_view key)
{
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &fields_[it->second].value;
}

const Value* Record::find(std::string_view key) const
{
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &fields_[it->second].value;
}

const Record::Field* Record::field(std::string_view key) const
{
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &fields_[it->second];
}

std::optional<std::size_t> Record::index_of(std::string_view key) const
{
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

void Record::set(std::string key, Value value)
{
    auto it = index_.find(key);
    if (it != index_.end()) {
        fields_[it->second].value = std::move(value);
        return;
    }
    index_.emplace(key, fields_.size());
    fields_.push_back(Field{std::move(key), std::move(value), true});
}

void Record::set(std::string key, Value value, bool enumerable)
{
    auto it = index_.find(key);
    if (it != index_.end()) {
        auto& f = fields_[it->second];
        f.value = std::move(value);
        f.enumerable = enumerable;
        return;
    }
    index_.emplace(key, fields_.size());
    fields_.push_back(Field{std::move(key), std::move(value), enumerable});
}

void Record::insert_at(std::size_t pos, Field field)
{
    erase(field.key);
    pos = std::min(pos, fields_.size());
    fields_.insert(fields_.begin() + static_cast<std::ptrdiff_t>(pos), std::move(field));
    reindex_from(pos);
}

bool Record::erase(std::string_view key)
{
    auto it = index_.find(key);
    if (it == index_.end()) return false;
    const std::size_t pos = it->second;
    index_.erase(it);
    fields_.erase(fields_.begin() + static_cast<std::ptrdiff_t>(pos));
    reindex_from(pos);
    return true;
}

void Record::reindex_from(std::size_t pos)
{
    for (std::size_t i = pos; i < fields_.size(); ++i) {
        index_.insert_or_assign(fields_[i].key, i);
    }
}

// ============================================================
// ValueMap
// ============================================================

bool ValueMap::contains(const Value& key) const
{
    return index_.find(key) != index_.end();
}

Value* ValueMap::find(const Value& key)
{
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].value;
}

const Value* ValueMap::find(const Value& key) const
{
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].value;
}

std::optional<std::size_t> ValueMap::index_of(const Value& key) const
{
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

void ValueMap::set(Value key, Value value)
{
    auto it = index_.find(key);
    if (it != index_.end()) {
        entries_[it->second].value = std::move(value);
        return;
    }
    index_.emplace(key, entries_.size());
    entries_.push_back(Entry{std::move(key), std::move(value)});
}

void ValueMap::insert_at(std::size_t pos, Entry entry)
{
    erase(entry.key);
    pos = std::min(pos, entries_.size());
    entries_.insert(entries_.begin() + static_cast<std::ptrdiff_t>(pos), std::move(entry));
    reindex_from(pos);
}

bool ValueMap::erase(const Value& key)
{
    auto it = index_.find(key);
    if (it == index_.end()) return false;
    const std::size_t pos = it->second;
    index_.erase(it);
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));
    reindex_from(pos);
    return true;
}

void ValueMap::reindex_from(std::size_t pos)
{
    for (std::size_t i = pos; i < entries_.size(); ++i) {
        index_.insert_or_assign(entries_[i].key, i);
    }
}

// ============================================================
// ValueSet
// ============================================================

bool ValueSet::contains(const Value& v) const
{
    return index_.find(v) != index_.end();
}

std::optional<std::size_t> ValueSet::index_of(const Value& v) const
{
    auto it = index_.find(v);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

bool ValueSet::insert(Value v)
{
    if (contains(v)) return false;
    index_.emplace(v, items_.size());
    items_.push_back(std::move(v));
    return true;
}

bool ValueSet::insert_at(std::size_t pos, Value v)
{
    if (contains(v)) return false;
    pos = std::min(pos, items_.size());
    items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(pos), std::move(v));
    reindex_from(pos);
    return true;
}

void ValueSet::replace_at(std::size_t pos, Value v)
{
    if (pos >= items_.size()) {
        detail::usage_error("ValueSet::replace_at", "position out of range");
    }
    auto existing = index_of(v);
    if (existing && *existing != pos) {
        detail::usage_error("ValueSet::replace_at", "value already a member at another position");
    }
    index_.erase(items_[pos]);
    items_[pos] = std::move(v);
    index_.insert_or_assign(items_[pos], pos);
}

bool ValueSet::erase(const Value& v)
{
    auto it = index_.find(v);
    if (it == index_.end()) return false;
    const std::size_t pos = it->second;
    index_.erase(it);
    items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(pos));
    reindex_from(pos);
    return true;
}

void ValueSet::reindex_from(std::size_t pos)
{
    for (std::size_t i = pos; i < items_.size(); ++i) {
        index_.insert_or_assign(items_[i], i);
    }
}

} // namespace deepdiff
