#pragma once

/// @file registry.hpp
/// @brief Node type registry and run-scoped node factory

#include "node.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace flow_graph {

// =============================================================================
// Passthrough Node
// =============================================================================

/// @brief Stand-in for unrecognized type tags; returns its input unchanged
class PassthroughNode : public NodeBase {
public:
    explicit PassthroughNode(NodeDescriptor descriptor);

    [[nodiscard]] ExecuteResult execute(ExecutionContext& ctx, const Value& input) override;
};

// =============================================================================
// Node Registry
// =============================================================================

/// @brief Maps type tags to constructor functions
class NodeRegistry {
public:
    using Constructor = std::function<std::unique_ptr<INode>(const NodeDescriptor&)>;

    NodeRegistry() = default;

    /// @brief Register (or replace) the constructor for a type tag
    void register_type(const std::string& type, Constructor constructor);

    /// @brief Convenience registration for node classes built from a descriptor
    template <typename T>
    void register_type(const std::string& type) {
        register_type(type, [](const NodeDescriptor& descriptor) -> std::unique_ptr<INode> {
            return std::make_unique<T>(descriptor);
        });
    }

    bool unregister_type(const std::string& type);

    [[nodiscard]] bool has_type(const std::string& type) const;
    [[nodiscard]] std::vector<std::string> types() const;
    [[nodiscard]] std::size_t size() const { return constructors_.size(); }

    /// @brief Construct a node; unknown types yield a PassthroughNode
    [[nodiscard]] std::unique_ptr<INode> construct(const NodeDescriptor& descriptor) const;

private:
    std::unordered_map<std::string, Constructor> constructors_;
};

// =============================================================================
// Node Factory
// =============================================================================

/// @brief Run-scoped factory caching one instance per node id, so a node
/// reached along several branches keeps its state for the whole run
class NodeFactory {
public:
    explicit NodeFactory(std::shared_ptr<const NodeRegistry> registry);

    [[nodiscard]] std::shared_ptr<INode> create(const NodeId& id, const std::string& type, const Value& config);
    [[nodiscard]] std::shared_ptr<INode> create(const NodeDescriptor& descriptor);

    [[nodiscard]] std::shared_ptr<INode> find(const NodeId& id) const;
    [[nodiscard]] std::size_t instance_count() const;

    /// Drop every cached instance
    void clear();

private:
    std::shared_ptr<const NodeRegistry> registry_;
    mutable std::mutex mutex_;
    std::unordered_map<NodeId, std::shared_ptr<INode>> instances_;
};

} // namespace flow_graph
