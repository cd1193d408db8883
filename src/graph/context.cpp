/// @file context.cpp
/// @brief ExecutionContext bookkeeping

#include <flow_engine/graph/context.hpp>
#include <flow_engine/core/log.hpp>

#include <iterator>

namespace flow_graph {

ExecutionContext::ExecutionContext(
    std::string run_id,
    NodeId trigger_node_id,
    std::shared_ptr<const FlowGraph> graph,
    std::shared_ptr<NodeFactory> factory)
    : run_id_(std::move(run_id))
    , trigger_node_id_(std::move(trigger_node_id))
    , graph_(std::move(graph))
    , factory_(std::move(factory))
    , board_(std::make_shared<RunBoard>())
{
}

ExecutionContext::ExecutionContext(const ExecutionContext& parent, std::optional<IterationInfo> iteration)
    : run_id_(parent.run_id_)
    , trigger_node_id_(parent.trigger_node_id_)
    , iteration_(std::move(iteration))
    , graph_(parent.graph_)
    , factory_(parent.factory_)
    , board_(parent.board_)
{
}

// =============================================================================
// Status
// =============================================================================

void ExecutionContext::update_state(
    const NodeId& id, NodeStatus status, std::optional<Value> result, std::string error)
{
    NodeState snapshot;
    StatusListener listener;
    {
        std::lock_guard<std::mutex> lock(board_->mutex);
        auto& state = board_->states[id];
        state.status = status;
        state.result = std::move(result);
        state.error = std::move(error);
        snapshot = state;
        listener = board_->listener;
    }
    if (listener) {
        listener(id, snapshot);
    }
}

void ExecutionContext::mark_running(const NodeId& id) {
    update_state(id, NodeStatus::Running, std::nullopt, {});
}

void ExecutionContext::mark_success(const NodeId& id, Value result) {
    update_state(id, NodeStatus::Success, std::move(result), {});
}

void ExecutionContext::mark_error(const NodeId& id, const std::string& message) {
    update_state(id, NodeStatus::Error, std::nullopt, message);
    flow_core::node_logger()->error("[Flow {}] {} failed: {}", run_id_, id, message);
}

void ExecutionContext::mark_skipped(const NodeId& id) {
    update_state(id, NodeStatus::Skipped, std::nullopt, {});
}

NodeState ExecutionContext::node_state(const NodeId& id) const {
    std::lock_guard<std::mutex> lock(board_->mutex);
    auto it = board_->states.find(id);
    return it != board_->states.end() ? it->second : NodeState{};
}

std::map<NodeId, NodeState> ExecutionContext::status_snapshot() const {
    std::lock_guard<std::mutex> lock(board_->mutex);
    return std::map<NodeId, NodeState>(board_->states.begin(), board_->states.end());
}

void ExecutionContext::set_status_listener(StatusListener listener) {
    std::lock_guard<std::mutex> lock(board_->mutex);
    board_->listener = std::move(listener);
}

// =============================================================================
// Outputs
// =============================================================================

void ExecutionContext::store_output(const NodeId& id, const Value& value) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outputs_[id].push_back(value);
    }
    mark_success(id, value);
}

std::vector<Value> ExecutionContext::get_output(const NodeId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = outputs_.find(id);
    return it != outputs_.end() ? it->second : std::vector<Value>{};
}

std::map<NodeId, std::vector<Value>> ExecutionContext::outputs_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::map<NodeId, std::vector<Value>>(outputs_.begin(), outputs_.end());
}

// =============================================================================
// Iteration
// =============================================================================

std::unique_ptr<ExecutionContext> ExecutionContext::create_iteration_context(
    std::size_t index, std::size_t total, Value item) const
{
    return std::unique_ptr<ExecutionContext>(
        new ExecutionContext(*this, IterationInfo{index, total, std::move(item)}));
}

std::unique_ptr<ExecutionContext> ExecutionContext::create_scope_context() const {
    return std::unique_ptr<ExecutionContext>(new ExecutionContext(*this, iteration_));
}

void ExecutionContext::merge_outputs(const ExecutionContext& scope) {
    if (&scope == this) {
        return;
    }
    auto produced = scope.outputs_snapshot();

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, values] : produced) {
        auto& list = outputs_[id];
        list.insert(list.end(), std::make_move_iterator(values.begin()), std::make_move_iterator(values.end()));
    }
}

// =============================================================================
// Dedup
// =============================================================================

bool ExecutionContext::has_executed_node(const NodeId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return executed_.count(id) > 0;
}

bool ExecutionContext::mark_node_executed(const NodeId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return executed_.insert(id).second;
}

// =============================================================================
// Log
// =============================================================================

void ExecutionContext::log(const std::string& message) {
    std::string line = iteration_
        ? "[" + std::to_string(iteration_->index + 1) + "/" + std::to_string(iteration_->total) + "] " + message
        : message;
    {
        std::lock_guard<std::mutex> lock(board_->mutex);
        board_->log.push_back(line);
    }
    flow_core::node_logger()->debug("[Flow {}] {}", run_id_, line);
}

std::vector<std::string> ExecutionContext::log_entries() const {
    std::lock_guard<std::mutex> lock(board_->mutex);
    return board_->log;
}

} // namespace flow_graph
