/// @file graph.cpp
/// @brief FlowGraph document loading and resolution

#include <flow_engine/graph/graph.hpp>
#include <flow_engine/core/log.hpp>

#include <algorithm>
#include <unordered_set>

namespace flow_graph {

using flow_core::Err;
using flow_core::GraphError;
using flow_core::Ok;
using flow_core::Result;

// =============================================================================
// NodeState
// =============================================================================

Value NodeState::to_json() const {
    Value out = Value::object();
    out["status"] = to_string(status);
    out["result"] = result ? *result : Value(nullptr);
    if (!error.empty()) {
        out["error"] = error;
    }
    return out;
}

// =============================================================================
// Loading
// =============================================================================

namespace {

std::string string_field(const Value& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // anonymous namespace

Result<FlowGraph> FlowGraph::from_json(const Value& document) {
    if (!document.is_object()) {
        return Err<FlowGraph>(GraphError::parse("document must be an object"));
    }

    auto nodes_it = document.find("nodes");
    if (nodes_it == document.end() || !nodes_it->is_array()) {
        return Err<FlowGraph>(GraphError::missing_field("nodes"));
    }

    FlowGraph graph;

    for (std::size_t i = 0; i < nodes_it->size(); ++i) {
        const Value& raw = (*nodes_it)[i];
        if (!raw.is_object()) {
            return Err<FlowGraph>(GraphError::parse("nodes[" + std::to_string(i) + "] is not an object"));
        }

        NodeDescriptor descriptor;
        descriptor.id = string_field(raw, "id");
        if (descriptor.id.empty()) {
            return Err<FlowGraph>(GraphError::missing_field("nodes[" + std::to_string(i) + "].id"));
        }
        descriptor.type = string_field(raw, "type");
        if (descriptor.type.empty()) {
            return Err<FlowGraph>(GraphError::missing_field("nodes[" + std::to_string(i) + "].type"));
        }

        // Editor documents carry configuration under "data"
        if (auto cfg = raw.find("config"); cfg != raw.end() && cfg->is_object()) {
            descriptor.config = *cfg;
        } else if (auto data = raw.find("data"); data != raw.end() && data->is_object()) {
            descriptor.config = *data;
        }

        descriptor.parent_id = string_field(raw, "parentId");
        if (descriptor.parent_id.empty()) {
            descriptor.parent_id = string_field(raw, "parentNode");
        }

        auto added = graph.add_node(std::move(descriptor));
        if (!added) {
            return Err<FlowGraph>(added.error());
        }
    }

    if (auto edges_it = document.find("edges"); edges_it != document.end()) {
        if (!edges_it->is_array()) {
            return Err<FlowGraph>(GraphError::parse("edges must be an array"));
        }
        for (const auto& raw : *edges_it) {
            if (!raw.is_object()) {
                continue;
            }
            Edge edge{string_field(raw, "source"), string_field(raw, "target"), string_field(raw, "sourceHandle")};
            graph.add_edge(std::move(edge));
        }
    }

    return graph;
}

Result<FlowGraph> FlowGraph::parse(const std::string& text) {
    try {
        return from_json(Value::parse(text));
    } catch (const nlohmann::json::parse_error& e) {
        return Err<FlowGraph>(GraphError::parse(e.what()));
    }
}

// =============================================================================
// Construction
// =============================================================================

Result<void> FlowGraph::add_node(NodeDescriptor descriptor) {
    if (index_.count(descriptor.id) > 0) {
        return Err(GraphError::duplicate_node(descriptor.id));
    }
    if (!descriptor.config.is_object()) {
        descriptor.config = Value::object();
    }
    index_[descriptor.id] = nodes_.size();
    nodes_.push_back(std::move(descriptor));
    return Ok();
}

bool FlowGraph::add_edge(Edge edge) {
    if (!contains(edge.source) || !contains(edge.target)) {
        flow_core::engine_logger()->warn("Dropping edge {} -> {}: endpoint not in graph", edge.source, edge.target);
        return false;
    }
    if (!same_scope(edge.source, edge.target)) {
        flow_core::engine_logger()->warn("Edge {} -> {} crosses a group boundary and will not be followed",
            edge.source, edge.target);
    }
    edges_.push_back(std::move(edge));
    return true;
}

// =============================================================================
// Queries
// =============================================================================

const NodeDescriptor* FlowGraph::node(const NodeId& id) const {
    auto it = index_.find(id);
    return it != index_.end() ? &nodes_[it->second] : nullptr;
}

bool FlowGraph::same_scope(const NodeId& a, const NodeId& b) const {
    const NodeDescriptor* na = node(a);
    const NodeDescriptor* nb = node(b);
    return na && nb && na->parent_id == nb->parent_id;
}

std::vector<Edge> FlowGraph::outgoing(const NodeId& id) const {
    std::vector<Edge> result;
    for (const auto& edge : edges_) {
        if (edge.source == id && same_scope(edge.source, edge.target)) {
            result.push_back(edge);
        }
    }
    return result;
}

std::vector<Edge> FlowGraph::incoming(const NodeId& id) const {
    std::vector<Edge> result;
    for (const auto& edge : edges_) {
        if (edge.target == id && same_scope(edge.source, edge.target)) {
            result.push_back(edge);
        }
    }
    return result;
}

std::vector<NodeId> FlowGraph::children_of(const NodeId& id) const {
    std::vector<NodeId> result;
    for (const auto& edge : outgoing(id)) {
        if (std::find(result.begin(), result.end(), edge.target) == result.end()) {
            result.push_back(edge.target);
        }
    }
    return result;
}

std::vector<Edge> FlowGraph::cross_scope_edges() const {
    std::vector<Edge> result;
    for (const auto& edge : edges_) {
        if (!same_scope(edge.source, edge.target)) {
            result.push_back(edge);
        }
    }
    return result;
}

std::vector<NodeId> FlowGraph::root_ids() const {
    std::unordered_set<NodeId> has_incoming;
    for (const auto& edge : edges_) {
        if (same_scope(edge.source, edge.target)) {
            has_incoming.insert(edge.target);
        }
    }

    std::vector<NodeId> roots;
    for (const auto& descriptor : nodes_) {
        if (!descriptor.has_parent() && has_incoming.count(descriptor.id) == 0) {
            roots.push_back(descriptor.id);
        }
    }
    return roots;
}

SubgraphPartition FlowGraph::partition(const NodeId& group_id) const {
    SubgraphPartition part;

    std::unordered_set<NodeId> members;
    for (const auto& descriptor : nodes_) {
        if (descriptor.parent_id == group_id && descriptor.id != group_id) {
            part.node_ids.push_back(descriptor.id);
            members.insert(descriptor.id);
        }
    }

    std::unordered_set<NodeId> has_incoming;
    std::unordered_set<NodeId> has_outgoing;
    for (const auto& edge : edges_) {
        if (members.count(edge.source) > 0 && members.count(edge.target) > 0) {
            part.edges.push_back(edge);
            part.adjacency[edge.source].push_back(edge.target);
            has_outgoing.insert(edge.source);
            has_incoming.insert(edge.target);
        }
    }

    for (const auto& id : part.node_ids) {
        if (has_incoming.count(id) == 0) {
            part.roots.push_back(id);
        }
        if (has_outgoing.count(id) == 0) {
            part.leaves.push_back(id);
        }
    }

    return part;
}

} // namespace flow_graph
