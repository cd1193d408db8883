#pragma once

/// @file node.hpp
/// @brief Node interface and base lifecycle

#include "config_store.hpp"
#include "context.hpp"
#include "types.hpp"

#include <flow_engine/core/error.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace flow_graph {

/// Outcome of a node's transform: a value to propagate, an empty optional to
/// stop this branch, or an error.
using ExecuteResult = flow_core::Result<std::optional<Value>>;

/// Ids from the start node down to the node currently processing, one per
/// branch. A child already on its own path closes a cycle.
using NodePath = std::vector<NodeId>;

// =============================================================================
// Node Interface
// =============================================================================

/// @brief Interface for all workflow nodes
class INode {
public:
    virtual ~INode() = default;

    [[nodiscard]] virtual const NodeId& id() const = 0;
    [[nodiscard]] virtual const std::string& type() const = 0;

    /// @brief Run the full lifecycle for one arrival of input
    ///
    /// Marks the node running, executes it, stores the result and processes
    /// the selected children concurrently, returning once all of them have
    /// returned. Failures are recorded on the context, never thrown.
    /// ancestors is the path that led here, excluding this node.
    virtual void process(ExecutionContext& ctx, const Value& input, const NodePath& ancestors) = 0;

    /// @brief Pure transform supplied by each node kind
    [[nodiscard]] virtual ExecuteResult execute(ExecutionContext& ctx, const Value& input) = 0;

    /// @brief Children to receive output (defaults to every outgoing edge)
    [[nodiscard]] virtual std::vector<NodeId> select_children(
        ExecutionContext& ctx, const Value& output) const = 0;
};

// =============================================================================
// Node Base Implementation
// =============================================================================

/// @brief Base lifecycle shared by every node kind
class NodeBase : public INode {
public:
    explicit NodeBase(NodeDescriptor descriptor, std::shared_ptr<IConfigStore> configs = nullptr);
    ~NodeBase() override = default;

    [[nodiscard]] const NodeId& id() const override { return descriptor_.id; }
    [[nodiscard]] const std::string& type() const override { return descriptor_.type; }
    [[nodiscard]] const NodeDescriptor& descriptor() const { return descriptor_; }

    void process(ExecutionContext& ctx, const Value& input, const NodePath& ancestors) override;

    [[nodiscard]] std::vector<NodeId> select_children(
        ExecutionContext& ctx, const Value& output) const override;

protected:
    /// Record a successful output; Group overrides to store items one by one
    virtual void store_result(ExecutionContext& ctx, const Value& output);

    /// Descriptor config overlaid with the store entry, read fresh each call
    [[nodiscard]] Value current_config() const;

    [[nodiscard]] IConfigStore* config_store() const { return configs_.get(); }

    [[nodiscard]] static ExecuteResult emit(Value value) {
        return ExecuteResult(std::optional<Value>(std::move(value)));
    }

    [[nodiscard]] static ExecuteResult stop() {
        return ExecuteResult(std::optional<Value>());
    }

    [[nodiscard]] static ExecuteResult fail(flow_core::Error error) {
        return ExecuteResult(std::move(error));
    }

    NodeDescriptor descriptor_;
    std::shared_ptr<IConfigStore> configs_;
};

// =============================================================================
// Fan-out
// =============================================================================

/// @brief Instantiate ids through the context's factory and process them
/// concurrently with the same input, returning once every one has returned.
/// Ids missing from the graph are logged and skipped. An id already in
/// ancestors is not processed; the node that led back to it is marked Error
/// ("cycle detected: a -> b -> a").
void fan_out(ExecutionContext& ctx, const std::vector<NodeId>& ids, const Value& input, const NodePath& ancestors);

/// Fan out below the node whose execute() is running on this thread (Group
/// roots, foreach children); from outside any node the path is empty
void fan_out(ExecutionContext& ctx, const std::vector<NodeId>& ids, const Value& input);

/// Path of the node whose execute() is running on this thread, itself included
[[nodiscard]] NodePath active_path();

} // namespace flow_graph
