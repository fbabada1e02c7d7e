// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <deepdiff/clone.h>

namespace deepdiff {

Value default_instantiate(const Node& node)
{
    const Value& v = node.value();

    switch (node.kind()) {
    case Kind::Sequence:
        return Value{std::make_shared<Sequence>(v.as_sequence().size())};
    case Kind::Set:
        return Value{std::make_shared<ValueSet>()};
    case Kind::Map:
        return Value{std::make_shared<ValueMap>()};
    case Kind::Record:
        return Value{std::make_shared<Record>(v.as_record().type_name())};
    case Kind::Timestamp:
        return Value::timestamp(v.as_timestamp());
    case Kind::Pattern:
        return Value{std::make_shared<Pattern>(v.as_pattern())};
    case Kind::BinaryBuffer:
        return Value{std::make_shared<ByteBuffer>(v.as_buffer())};
    case Kind::BinaryView: {
        auto bytes = v.as_view().bytes();
        auto buffer = std::make_shared<ByteBuffer>(bytes.begin(), bytes.end());
        const std::size_t length = buffer->size();
        return Value::view(std::move(buffer), 0, length);
    }
    default:
        return v;
    }
}

// ============================================================
// Clone
// ============================================================

Clone::Clone(CloneOptions options)
    : Visitor(std::move(options))
{
}

Value Clone::clone(const Value& value)
{
    CloneContext ctx;
    Node root{value};
    visit(root, ctx);
    return std::move(ctx.result);
}

Value Clone::instantiate(const Node& node) const
{
    if (options().instantiate) {
        return options().instantiate(node);
    }
    return default_instantiate(node);
}

Flow Clone::visit_node(const Node& node, CloneContext& ctx)
{
    Value mirror = instantiate(node);

    // Children are only cloned into a fresh container of the same kind
    const bool fill = is_container(node.kind()) && mirror.kind() == node.kind() &&
                      mirror.identity() != node.value().identity();

    if (options().guard_circular_refs && is_container(node.kind())) {
        ctx.clones.insert_or_assign(node.value().identity(), mirror);
    }

    Flow flow = Flow::Continue;
    if (fill) {
        ctx.mirrors.push_back(mirror);
        flow = dispatch(node, ctx);
        ctx.mirrors.pop_back();
    }

    attach(node, std::move(mirror), ctx);
    return flow;
}

Flow Clone::revisit(const Node& node, CloneContext& ctx)
{
    auto it = ctx.clones.find(node.value().identity());
    if (it == ctx.clones.end()) {
        detail::usage_error("Clone::revisit", "container entered without a registered clone");
    }
    attach(node, it->second, ctx);
    return Flow::Continue;
}

void Clone::attach(const Node& node, Value mirror, CloneContext& ctx) const
{
    const Node* parent = node.parent();
    if (!parent) {
        ctx.result = std::move(mirror);
        return;
    }
    if (ctx.mirrors.empty()) {
        detail::usage_error("Clone::attach", "child visited outside of its parent container");
    }
    const Value& target = ctx.mirrors.back();

    switch (parent->kind()) {
    case Kind::Record: {
        const std::string& key = std::get<std::string>(node.key());
        const auto* field = parent->value().as_record().field(key);
        target.as_record().set(key, std::move(mirror), field ? field->enumerable : true);
        break;
    }
    case Kind::Sequence: {
        auto& seq = target.as_sequence();
        const std::size_t index = std::get<std::size_t>(node.key());
        if (index >= seq.size()) seq.resize(index + 1);
        seq[index] = std::move(mirror);
        break;
    }
    case Kind::Map:
        target.as_map().set(std::get<Value>(node.key()), std::move(mirror));
        break;
    case Kind::Set:
        target.as_set().insert(std::move(mirror));
        break;
    default:
        detail::usage_error("Clone::attach", "parent is not a container");
    }
}

Value clone(const Value& value, const CloneOptions& options)
{
    return Clone{options}.clone(value);
}

} // namespace deepdiff
