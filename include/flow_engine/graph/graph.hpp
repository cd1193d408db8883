#pragma once

/// @file graph.hpp
/// @brief Graph document and dynamic child resolution
///
/// Children, roots and group partitions are derived from the node and edge
/// lists on every call, so a graph edited between runs needs no rebuild.
/// Edges are followed only within a scope: a node reaches targets that share
/// its parent group (or the top level).

#include "types.hpp"

#include <flow_engine/core/error.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace flow_graph {

/// Subgraph owned by one group node
struct SubgraphPartition {
    std::vector<NodeId> node_ids;
    std::vector<Edge> edges;
    std::unordered_map<NodeId, std::vector<NodeId>> adjacency;
    std::vector<NodeId> roots;   // No incoming internal edge
    std::vector<NodeId> leaves;  // No outgoing internal edge
};

class FlowGraph {
public:
    FlowGraph() = default;

    /// Build from {nodes: [...], edges: [...]}
    [[nodiscard]] static flow_core::Result<FlowGraph> from_json(const Value& document);

    /// Parse JSON text, then from_json
    [[nodiscard]] static flow_core::Result<FlowGraph> parse(const std::string& text);

    // ==========================================================================
    // Construction
    // ==========================================================================

    flow_core::Result<void> add_node(NodeDescriptor descriptor);

    /// Returns false (and drops the edge) when an endpoint is unknown. An edge
    /// whose endpoints have different parents is kept but warned about, since
    /// traversal never follows it.
    bool add_edge(Edge edge);

    // ==========================================================================
    // Queries
    // ==========================================================================

    [[nodiscard]] const NodeDescriptor* node(const NodeId& id) const;
    [[nodiscard]] bool contains(const NodeId& id) const { return index_.count(id) > 0; }

    [[nodiscard]] const std::vector<NodeDescriptor>& nodes() const { return nodes_; }
    [[nodiscard]] const std::vector<Edge>& edges() const { return edges_; }
    [[nodiscard]] std::size_t node_count() const { return nodes_.size(); }
    [[nodiscard]] std::size_t edge_count() const { return edges_.size(); }

    /// Edges leaving id whose target is in the same scope
    [[nodiscard]] std::vector<Edge> outgoing(const NodeId& id) const;

    /// Edges entering id whose source is in the same scope
    [[nodiscard]] std::vector<Edge> incoming(const NodeId& id) const;

    /// Distinct targets of outgoing(id), in edge order
    [[nodiscard]] std::vector<NodeId> children_of(const NodeId& id) const;

    /// Edges between different scopes (a group member and an outer node)
    [[nodiscard]] std::vector<Edge> cross_scope_edges() const;

    /// Top-level nodes without incoming edges
    [[nodiscard]] std::vector<NodeId> root_ids() const;

    /// Nodes whose parent is group_id, with their internal edges
    [[nodiscard]] SubgraphPartition partition(const NodeId& group_id) const;

private:
    [[nodiscard]] bool same_scope(const NodeId& a, const NodeId& b) const;

    std::vector<NodeDescriptor> nodes_;
    std::unordered_map<NodeId, std::size_t> index_;
    std::vector<Edge> edges_;
};

} // namespace flow_graph
