/// @file registry.cpp
/// @brief Node registry, factory and passthrough fallback

#include <flow_engine/graph/registry.hpp>
#include <flow_engine/core/log.hpp>

#include <algorithm>

namespace flow_graph {

// =============================================================================
// PassthroughNode
// =============================================================================

PassthroughNode::PassthroughNode(NodeDescriptor descriptor)
    : NodeBase(std::move(descriptor))
{
}

ExecuteResult PassthroughNode::execute(ExecutionContext& ctx, const Value& input) {
    flow_core::node_logger()->warn("Node '{}' has no implementation for type '{}', passing input through",
        id(), type());
    ctx.log("Passthrough(" + id() + "): type '" + type() + "' not registered");
    return emit(input);
}

// =============================================================================
// NodeRegistry
// =============================================================================

void NodeRegistry::register_type(const std::string& type, Constructor constructor) {
    constructors_[type] = std::move(constructor);
}

bool NodeRegistry::unregister_type(const std::string& type) {
    return constructors_.erase(type) > 0;
}

bool NodeRegistry::has_type(const std::string& type) const {
    return constructors_.count(type) > 0;
}

std::vector<std::string> NodeRegistry::types() const {
    std::vector<std::string> result;
    result.reserve(constructors_.size());
    for (const auto& [type, ctor] : constructors_) {
        result.push_back(type);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::unique_ptr<INode> NodeRegistry::construct(const NodeDescriptor& descriptor) const {
    auto it = constructors_.find(descriptor.type);
    if (it == constructors_.end()) {
        flow_core::engine_logger()->warn("Unknown node type '{}' for node '{}', using passthrough",
            descriptor.type, descriptor.id);
        return std::make_unique<PassthroughNode>(descriptor);
    }
    return it->second(descriptor);
}

// =============================================================================
// NodeFactory
// =============================================================================

NodeFactory::NodeFactory(std::shared_ptr<const NodeRegistry> registry)
    : registry_(std::move(registry))
{
}

std::shared_ptr<INode> NodeFactory::create(const NodeId& id, const std::string& type, const Value& config) {
    NodeDescriptor descriptor;
    descriptor.id = id;
    descriptor.type = type;
    descriptor.config = config;
    return create(descriptor);
}

std::shared_ptr<INode> NodeFactory::create(const NodeDescriptor& descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = instances_.find(descriptor.id);
    if (it != instances_.end() && it->second->type() == descriptor.type) {
        return it->second;
    }

    std::shared_ptr<INode> node = registry_->construct(descriptor);
    instances_[descriptor.id] = node;
    return node;
}

std::shared_ptr<INode> NodeFactory::find(const NodeId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(id);
    return it != instances_.end() ? it->second : nullptr;
}

std::size_t NodeFactory::instance_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.size();
}

void NodeFactory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    instances_.clear();
}

} // namespace flow_graph
