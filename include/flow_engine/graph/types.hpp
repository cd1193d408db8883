#pragma once

/// @file types.hpp
/// @brief Core types for flow_graph

#include <flow_engine/core/value.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace flow_graph {

using flow_core::Value;

/// Node identifiers are the editor-assigned strings of the graph document
using NodeId = std::string;

// =============================================================================
// Type Tags
// =============================================================================

namespace node_types {

inline constexpr const char* Input = "input";
inline constexpr const char* Output = "output";
inline constexpr const char* Api = "api";
inline constexpr const char* Llm = "llm";
inline constexpr const char* JsonExtractor = "json-extractor";
inline constexpr const char* WebCrawler = "web-crawler";
inline constexpr const char* HtmlParser = "html-parser";
inline constexpr const char* Conditional = "conditional";
inline constexpr const char* Group = "group";
inline constexpr const char* Merger = "merger";
inline constexpr const char* Passthrough = "passthrough";

} // namespace node_types

// =============================================================================
// Source Handles
// =============================================================================

namespace handles {

inline constexpr const char* True = "trueHandle";
inline constexpr const char* False = "falseHandle";

/// Legacy editor handle, e.g. "cond1-source-true"
[[nodiscard]] inline std::string legacy(const NodeId& id, bool branch) {
    return id + (branch ? "-source-true" : "-source-false");
}

} // namespace handles

// =============================================================================
// Graph Elements
// =============================================================================

/// Immutable description of one node for the duration of a run
struct NodeDescriptor {
    NodeId id;
    std::string type;
    Value config = Value::object();
    NodeId parent_id;  // Empty at top level

    [[nodiscard]] bool has_parent() const { return !parent_id.empty(); }
};

/// Directed connection, optionally tagged with a named handle
struct Edge {
    NodeId source;
    NodeId target;
    std::string source_handle;
};

// =============================================================================
// Node Status
// =============================================================================

enum class NodeStatus : std::uint8_t {
    Idle,
    Running,
    Success,
    Error,
    Skipped,
};

[[nodiscard]] inline const char* to_string(NodeStatus status) {
    switch (status) {
        case NodeStatus::Idle: return "idle";
        case NodeStatus::Running: return "running";
        case NodeStatus::Success: return "success";
        case NodeStatus::Error: return "error";
        case NodeStatus::Skipped: return "skipped";
        default: return "unknown";
    }
}

/// Per-node status snapshot exposed to observers
struct NodeState {
    NodeStatus status = NodeStatus::Idle;
    std::optional<Value> result;
    std::string error;

    [[nodiscard]] Value to_json() const;
};

} // namespace flow_graph
