// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <deepdiff/property_enum.h>
#include <deepdiff/value.h>

#include <algorithm>

namespace deepdiff {

std::vector<std::string> enumerable_keys(const Record& record)
{
    std::vector<std::string> keys;
    keys.reserve(record.size());
    for (const auto& field : record.fields()) {
        if (field.enumerable) {
            keys.push_back(field.key);
        }
    }
    return keys;
}

std::vector<std::string> all_keys(const Record& record)
{
    std::vector<std::string> keys;
    keys.reserve(record.size());
    for (const auto& field : record.fields()) {
        keys.push_back(field.key);
    }
    return keys;
}

std::vector<std::string> sorted_keys(const Record& record)
{
    auto keys = enumerable_keys(record);
    std::sort(keys.begin(), keys.end());
    return keys;
}

PropertyFilter exclude_keys(std::initializer_list<std::string_view> keys)
{
    std::vector<std::string> excluded(keys.begin(), keys.end());
    return [excluded = std::move(excluded)](const Node&, std::string_view key) {
        return std::find(excluded.begin(), excluded.end(), key) == excluded.end();
    };
}

PropertyFilter exclude_prefix(std::string prefix)
{
    return [prefix = std::move(prefix)](const Node&, std::string_view key) {
        return !key.starts_with(prefix);
    };
}

} // namespace deepdiff
