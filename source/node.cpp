// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <deepdiff/node.h>

#include <algorithm>

namespace deepdiff {

std::size_t Node::depth() const noexcept
{
    std::size_t d = 0;
    for (const Node* p = parent_; p; p = p->parent_) {
        ++d;
    }
    return d;
}

const std::vector<std::string>& Node::properties(const PropertyEnumerator& enumerate,
                                                 const PropertyFilter& filter) const
{
    if (properties_) return *properties_;

    std::vector<std::string> keys;
    if (auto* rec = value_.get_if<RecordPtr>(); rec && *rec) {
        keys = enumerate ? enumerate(**rec) : enumerable_keys(**rec);
        if (filter) {
            keys.erase(std::remove_if(keys.begin(), keys.end(),
                                      [&](const std::string& k) { return !filter(*this, k); }),
                       keys.end());
        }
    }
    properties_ = std::move(keys);
    return *properties_;
}

} // namespace deepdiff
