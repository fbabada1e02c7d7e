// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <deepdiff/traverse.h>

namespace deepdiff {

Traverse::Traverse(VisitOptions options)
    : Visitor(std::move(options))
{
}

std::optional<Value> Traverse::traverse(const Value& value, TraverseCallback callback)
{
    TraverseContext ctx;
    ctx.callback = std::move(callback);

    Node root{value};
    visit(root, ctx);
    return std::move(ctx.stopped_at);
}

Flow Traverse::visit_node(const Node& node, TraverseContext& ctx)
{
    VisitAction action = ctx.callback ? ctx.callback(node) : VisitAction::descend();

    switch (action.type()) {
    case VisitAction::Type::Skip:
        return Flow::Continue;

    case VisitAction::Type::Stop:
        ctx.stopped_at = node.value();
        return Flow::Stop;

    case VisitAction::Type::Children: {
        const auto& values = action.explicit_children();
        std::vector<Node> children;
        children.reserve(values.size());
        for (std::size_t i = 0; i < values.size(); ++i) {
            children.emplace_back(values[i], &node, i, i);
        }
        return visit_children(node, children, ctx);
    }

    case VisitAction::Type::Descend:
        break;
    }

    // Children done, or the walk stopped below this node
    const Flow flow = dispatch(node, ctx);
    if (action.after()) {
        action.after()();
    }
    return flow;
}

std::optional<Value> traverse(const Value& value, TraverseCallback callback, const VisitOptions& options)
{
    return Traverse{options}.traverse(value, std::move(callback));
}

} // namespace deepdiff
