/// @file group.cpp
/// @brief GroupNode: runs its parented sub-pipeline and gathers leaf outputs

#include <flow_engine/nodes/control.hpp>
#include <flow_engine/core/log.hpp>

namespace flow_nodes {

GroupNode::GroupNode(NodeDescriptor descriptor, std::shared_ptr<IConfigStore> configs)
    : NodeBase(std::move(descriptor), std::move(configs))
{
}

ExecuteResult GroupNode::execute(ExecutionContext& ctx, const Value& input) {
    auto partition = ctx.graph().partition(id());
    if (partition.node_ids.empty() || partition.roots.empty()) {
        ctx.log("Group(" + id() + "): no internal nodes");
        return emit(Value::array());
    }

    // Dedup and leaf outputs belong to this traversal only, so a second
    // arrival runs the sub-pipeline again and never re-collects old items
    auto scope = ctx.create_scope_context();

    std::vector<NodeId> roots;
    for (const auto& root : partition.roots) {
        if (scope->mark_node_executed(root)) {
            roots.push_back(root);
        }
    }

    ctx.log("Group(" + id() + "): running " + std::to_string(partition.node_ids.size()) +
        " nodes from " + std::to_string(roots.size()) + " roots");
    fan_out(*scope, roots, input);

    Value collected = Value::array();
    for (const auto& leaf : partition.leaves) {
        for (auto& value : scope->get_output(leaf)) {
            collected.push_back(std::move(value));
        }
    }
    ctx.merge_outputs(*scope);

    flow_core::node_logger()->debug("Group {} collected {} leaf outputs", id(), collected.size());
    return emit(std::move(collected));
}

void GroupNode::store_result(ExecutionContext& ctx, const Value& output) {
    if (output.is_array()) {
        for (const auto& item : output) {
            ctx.store_output(id(), item);
        }
    }
    ctx.mark_success(id(), output);
}

} // namespace flow_nodes
