#pragma once

/// @file runner.hpp
/// @brief Triggers runs over a FlowGraph

#include "context.hpp"
#include "graph.hpp"
#include "registry.hpp"

#include <flow_engine/core/error.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace flow_graph {

/// Options for a single run
struct RunOptions {
    std::optional<NodeId> trigger;  // All roots when empty
    Value input = nullptr;
    ExecutionContext::StatusListener listener;
};

/// Everything observable about a finished run
struct RunReport {
    std::string run_id;
    NodeId trigger;
    std::map<NodeId, NodeState> statuses;
    std::map<NodeId, std::vector<Value>> outputs;
    std::vector<std::string> log;

    [[nodiscard]] bool has_errors() const;
    [[nodiscard]] std::size_t count(NodeStatus status) const;
    [[nodiscard]] Value to_json() const;
};

/// @brief Creates an ExecutionContext and factory per run and processes the
/// trigger node (or every root concurrently). Returns when the run settles.
class FlowRunner {
public:
    explicit FlowRunner(std::shared_ptr<const NodeRegistry> registry);

    [[nodiscard]] flow_core::Result<RunReport> run(
        std::shared_ptr<const FlowGraph> graph,
        const RunOptions& options = {});

    /// Trigger a single group node
    [[nodiscard]] flow_core::Result<RunReport> run_group(
        std::shared_ptr<const FlowGraph> graph,
        const NodeId& group_id,
        Value input = nullptr);

    [[nodiscard]] const NodeRegistry& registry() const { return *registry_; }

private:
    [[nodiscard]] static std::string next_run_id();

    std::shared_ptr<const NodeRegistry> registry_;
};

} // namespace flow_graph
