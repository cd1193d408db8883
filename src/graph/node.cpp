/// @file node.cpp
/// @brief Base node lifecycle and concurrent fan-out

#include <flow_engine/graph/node.hpp>
#include <flow_engine/graph/registry.hpp>
#include <flow_engine/core/log.hpp>

#include <algorithm>
#include <future>
#include <system_error>

namespace flow_graph {

namespace {

thread_local const NodePath* t_active_path = nullptr;

/// Publishes a node's path to fan_out calls made from its execute()
class ActivePathScope {
public:
    explicit ActivePathScope(const NodePath& path)
        : previous_(t_active_path)
    {
        t_active_path = &path;
    }

    ~ActivePathScope() { t_active_path = previous_; }

    ActivePathScope(const ActivePathScope&) = delete;
    ActivePathScope& operator=(const ActivePathScope&) = delete;

private:
    const NodePath* previous_;
};

std::string describe_cycle(const NodePath& ancestors, const NodeId& id) {
    auto first = std::find(ancestors.begin(), ancestors.end(), id);
    std::string text;
    for (auto it = first; it != ancestors.end(); ++it) {
        text += *it + " -> ";
    }
    return text + id;
}

} // anonymous namespace

// =============================================================================
// NodeBase
// =============================================================================

NodeBase::NodeBase(NodeDescriptor descriptor, std::shared_ptr<IConfigStore> configs)
    : descriptor_(std::move(descriptor))
    , configs_(std::move(configs))
{
}

void NodeBase::process(ExecutionContext& ctx, const Value& input, const NodePath& ancestors) {
    ctx.mark_running(id());

    NodePath path = ancestors;
    path.push_back(id());

    std::optional<Value> output;
    try {
        ActivePathScope scope(path);
        auto result = execute(ctx, input);
        if (!result) {
            const auto& error = result.error();
            ctx.log(type() + "(" + id() + "): " + flow_core::build_error_chain(error));
            ctx.mark_error(id(), error.message());
            return;
        }
        output = std::move(*result);
    } catch (const std::exception& e) {
        ctx.log(type() + "(" + id() + "): unhandled failure: " + e.what());
        ctx.mark_error(id(), e.what());
        return;
    }

    // Explicit stop: the branch ends here
    if (!output) {
        ctx.mark_success(id(), Value(nullptr));
        return;
    }

    std::vector<NodeId> children;
    try {
        store_result(ctx, *output);
        children = select_children(ctx, *output);
    } catch (const std::exception& e) {
        ctx.mark_error(id(), e.what());
        return;
    }

    if (!children.empty()) {
        fan_out(ctx, children, *output, path);
    }
}

std::vector<NodeId> NodeBase::select_children(ExecutionContext& ctx, const Value& /*output*/) const {
    return ctx.graph().children_of(id());
}

void NodeBase::store_result(ExecutionContext& ctx, const Value& output) {
    ctx.store_output(id(), output);
}

Value NodeBase::current_config() const {
    Value config = descriptor_.config.is_object() ? descriptor_.config : Value::object();
    if (configs_) {
        if (auto stored = configs_->get(id()); stored && stored->is_object()) {
            config.merge_patch(*stored);
        }
    }
    return config;
}

// =============================================================================
// Fan-out
// =============================================================================

NodePath active_path() {
    return t_active_path ? *t_active_path : NodePath{};
}

void fan_out(ExecutionContext& ctx, const std::vector<NodeId>& ids, const Value& input) {
    fan_out(ctx, ids, input, active_path());
}

void fan_out(ExecutionContext& ctx, const std::vector<NodeId>& ids, const Value& input, const NodePath& ancestors) {
    std::vector<std::shared_ptr<INode>> nodes;
    nodes.reserve(ids.size());
    for (const auto& id : ids) {
        const NodeDescriptor* descriptor = ctx.graph().node(id);
        if (!descriptor) {
            ctx.log("Skipping unknown node " + id);
            continue;
        }
        // The edge closing the loop belongs to ancestors.back(), which has
        // already stored its result; the error lands there
        if (std::find(ancestors.begin(), ancestors.end(), id) != ancestors.end()) {
            std::string cycle = describe_cycle(ancestors, id);
            ctx.log("Cycle detected: " + cycle);
            ctx.mark_error(ancestors.back(), "cycle detected: " + cycle);
            continue;
        }
        nodes.push_back(ctx.factory().create(*descriptor));
    }

    if (nodes.empty()) {
        return;
    }

    if (nodes.size() == 1) {
        nodes.front()->process(ctx, input, ancestors);
        return;
    }

    std::vector<std::future<void>> pending;
    pending.reserve(nodes.size());
    for (const auto& node : nodes) {
        try {
            pending.push_back(std::async(std::launch::async, [&ctx, node, &input, &ancestors]() {
                node->process(ctx, input, ancestors);
            }));
        } catch (const std::system_error& e) {
            flow_core::engine_logger()->warn("Could not spawn task for {} ({}), running inline", node->id(), e.what());
            node->process(ctx, input, ancestors);
        }
    }

    for (auto& task : pending) {
        task.get();
    }
}

} // namespace flow_graph
