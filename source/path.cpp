// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <deepdiff/path.h>

#include <boost/container_hash/hash.hpp>

namespace deepdiff {

std::string content_hash(const Value& value)
{
    return std::to_string(boost::hash<std::string>{}(value_to_string(value)));
}

std::string segment_to_string(const PathSegment& segment)
{
    return std::visit([&](const auto& key) -> std::string {
        using T = std::decay_t<decltype(key)>;
        if constexpr (std::is_same_v<T, std::string>) {
            if (segment.container == Kind::Set) return "<" + key + ">";
            return "." + key;
        } else if constexpr (std::is_same_v<T, std::ptrdiff_t>) {
            if (segment.container == Kind::Set) return "<#" + std::to_string(key) + ">";
            if (is_insert_marker(key)) return "[+" + std::to_string(insert_index(key)) + "]";
            return "[" + std::to_string(key) + "]";
        } else {
            return "{" + value_to_string(key) + "}";
        }
    }, segment.key);
}

std::string path_to_string(const Path& path)
{
    std::string result;
    for (const auto& segment : path) {
        result += segment_to_string(segment);
    }
    return result.empty() ? "/" : result;
}

} // namespace deepdiff
