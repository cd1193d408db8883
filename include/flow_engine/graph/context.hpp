#pragma once

/// @file context.hpp
/// @brief Run-scoped execution state shared by all nodes of one run

#include "graph.hpp"
#include "types.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace flow_graph {

class NodeFactory;

/// Iteration metadata of a foreach context
struct IterationInfo {
    std::size_t index = 0;
    std::size_t total = 0;
    Value item;
};

/// Bookkeeping for one triggered run (or one foreach iteration of it).
///
/// Every mutation is guarded: sibling branches run on separate threads and
/// call into the same context concurrently. Iteration contexts share the
/// status board and log with the run that created them, but keep their own
/// output lists and executed-node set.
class ExecutionContext {
public:
    using StatusListener = std::function<void(const NodeId&, const NodeState&)>;

    ExecutionContext(
        std::string run_id,
        NodeId trigger_node_id,
        std::shared_ptr<const FlowGraph> graph,
        std::shared_ptr<NodeFactory> factory);

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    // ==========================================================================
    // Identity
    // ==========================================================================

    [[nodiscard]] const std::string& run_id() const { return run_id_; }
    [[nodiscard]] const NodeId& trigger_node_id() const { return trigger_node_id_; }
    [[nodiscard]] const std::optional<IterationInfo>& iteration() const { return iteration_; }

    [[nodiscard]] const FlowGraph& graph() const { return *graph_; }
    [[nodiscard]] NodeFactory& factory() const { return *factory_; }

    // ==========================================================================
    // Status
    // ==========================================================================

    void mark_running(const NodeId& id);
    void mark_success(const NodeId& id, Value result);
    void mark_error(const NodeId& id, const std::string& message);
    void mark_skipped(const NodeId& id);

    /// Current state; Idle for nodes never touched
    [[nodiscard]] NodeState node_state(const NodeId& id) const;
    [[nodiscard]] std::map<NodeId, NodeState> status_snapshot() const;

    /// Observer called after every status transition
    void set_status_listener(StatusListener listener);

    // ==========================================================================
    // Outputs
    // ==========================================================================

    /// Append to the node's output list and mark it successful
    void store_output(const NodeId& id, const Value& value);

    /// All values the node emitted in this context (empty if none)
    [[nodiscard]] std::vector<Value> get_output(const NodeId& id) const;

    [[nodiscard]] std::map<NodeId, std::vector<Value>> outputs_snapshot() const;

    // ==========================================================================
    // Iteration
    // ==========================================================================

    [[nodiscard]] std::unique_ptr<ExecutionContext> create_iteration_context(
        std::size_t index, std::size_t total, Value item) const;

    /// Same run and iteration, empty outputs and executed-node set. One group
    /// traversal runs in one of these.
    [[nodiscard]] std::unique_ptr<ExecutionContext> create_scope_context() const;

    /// Append every output list of scope to this context's lists
    void merge_outputs(const ExecutionContext& scope);

    // ==========================================================================
    // Dedup
    // ==========================================================================

    [[nodiscard]] bool has_executed_node(const NodeId& id) const;

    /// Returns true when id was not yet marked
    bool mark_node_executed(const NodeId& id);

    // ==========================================================================
    // Log
    // ==========================================================================

    void log(const std::string& message);
    [[nodiscard]] std::vector<std::string> log_entries() const;

private:
    struct RunBoard {
        std::mutex mutex;
        std::unordered_map<NodeId, NodeState> states;
        std::vector<std::string> log;
        StatusListener listener;
    };

    ExecutionContext(const ExecutionContext& parent, std::optional<IterationInfo> iteration);

    void update_state(const NodeId& id, NodeStatus status, std::optional<Value> result, std::string error);

    std::string run_id_;
    NodeId trigger_node_id_;
    std::optional<IterationInfo> iteration_;
    std::shared_ptr<const FlowGraph> graph_;
    std::shared_ptr<NodeFactory> factory_;
    std::shared_ptr<RunBoard> board_;

    mutable std::mutex mutex_;
    std::unordered_map<NodeId, std::vector<Value>> outputs_;
    std::unordered_set<NodeId> executed_;
};

} // namespace flow_graph
