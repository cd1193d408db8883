/// @file runner.cpp
/// @brief FlowRunner implementation

#include <flow_engine/graph/runner.hpp>
#include <flow_engine/core/log.hpp>

#include <atomic>
#include <chrono>

namespace flow_graph {

using flow_core::Err;
using flow_core::GraphError;
using flow_core::Result;

// =============================================================================
// RunReport
// =============================================================================

bool RunReport::has_errors() const {
    return count(NodeStatus::Error) > 0;
}

std::size_t RunReport::count(NodeStatus status) const {
    std::size_t n = 0;
    for (const auto& [id, state] : statuses) {
        if (state.status == status) {
            ++n;
        }
    }
    return n;
}

Value RunReport::to_json() const {
    Value out = Value::object();
    out["runId"] = run_id;
    out["trigger"] = trigger.empty() ? Value(nullptr) : Value(trigger);

    Value states = Value::object();
    for (const auto& [id, state] : statuses) {
        states[id] = state.to_json();
    }
    out["statuses"] = std::move(states);

    Value outs = Value::object();
    for (const auto& [id, values] : outputs) {
        outs[id] = values;
    }
    out["outputs"] = std::move(outs);
    out["log"] = log;
    return out;
}

// =============================================================================
// FlowRunner
// =============================================================================

FlowRunner::FlowRunner(std::shared_ptr<const NodeRegistry> registry)
    : registry_(std::move(registry))
{
}

std::string FlowRunner::next_run_id() {
    static std::atomic<std::uint64_t> counter{0};
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "run-" + std::to_string(millis) + "-" + std::to_string(counter.fetch_add(1) + 1);
}

Result<RunReport> FlowRunner::run(std::shared_ptr<const FlowGraph> graph, const RunOptions& options) {
    if (!graph) {
        return Err<RunReport>(flow_core::Error(flow_core::ErrorCode::InvalidArgument, "No graph to run"));
    }

    std::vector<NodeId> start;
    if (options.trigger) {
        if (!graph->contains(*options.trigger)) {
            return Err<RunReport>(GraphError::unknown_node(*options.trigger));
        }
        start.push_back(*options.trigger);
    } else {
        start = graph->root_ids();
    }

    auto factory = std::make_shared<NodeFactory>(registry_);
    ExecutionContext ctx(next_run_id(), options.trigger.value_or(NodeId{}), graph, factory);
    if (options.listener) {
        ctx.set_status_listener(options.listener);
    }

    {
        flow_core::LogScope scope("run " + ctx.run_id());
        flow_core::engine_logger()->info("Run {} starting from {} node(s)", ctx.run_id(), start.size());
        ctx.log("Run started with " + std::to_string(start.size()) + " start node(s)");

        fan_out(ctx, start, options.input, NodePath{});

        ctx.log("Run finished");
    }

    RunReport report;
    report.run_id = ctx.run_id();
    report.trigger = ctx.trigger_node_id();
    report.statuses = ctx.status_snapshot();
    report.outputs = ctx.outputs_snapshot();
    report.log = ctx.log_entries();

    flow_core::engine_logger()->info("Run {} finished: {} succeeded, {} failed, {} skipped",
        report.run_id, report.count(NodeStatus::Success), report.count(NodeStatus::Error),
        report.count(NodeStatus::Skipped));

    return report;
}

Result<RunReport> FlowRunner::run_group(
    std::shared_ptr<const FlowGraph> graph, const NodeId& group_id, Value input)
{
    if (graph) {
        const NodeDescriptor* descriptor = graph->node(group_id);
        if (descriptor && descriptor->type != node_types::Group) {
            return Err<RunReport>(flow_core::Error(flow_core::ErrorCode::InvalidArgument,
                "Node '" + group_id + "' is not a group"));
        }
    }

    RunOptions options;
    options.trigger = group_id;
    options.input = std::move(input);
    return run(std::move(graph), options);
}

} // namespace flow_graph
