#pragma once

/// @file control.hpp
/// @brief Control-flow nodes: Conditional, Group, Merger

#include <flow_engine/graph/node.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace flow_nodes {

using flow_graph::ExecuteResult;
using flow_graph::ExecutionContext;
using flow_graph::IConfigStore;
using flow_graph::NodeBase;
using flow_graph::NodeDescriptor;
using flow_graph::NodeId;
using flow_graph::Value;

// =============================================================================
// Conditional
// =============================================================================

enum class ConditionType : std::uint8_t {
    NumberGreaterThan,
    NumberLessThan,
    EqualTo,
    ContainsSubstring,
    JsonPathExistsTruthy,
};

[[nodiscard]] const char* to_string(ConditionType type);

/// Accepts the canonical names and the legacy snake_case / "contains" aliases
[[nodiscard]] std::optional<ConditionType> parse_condition_type(const std::string& name);

/// Canonical {conditionType, value} pair
struct ConditionConfig {
    ConditionType type = ConditionType::EqualTo;
    Value value = true;

    /// Normalizes the accepted shapes:
    ///   {conditionType, conditionValue} | {conditionType, value} |
    ///   {condition: {type, value}} | {} (equals true)
    [[nodiscard]] static ConditionConfig from_json(const Value& config);
};

/// Evaluate; never throws. Non-numeric operands fail closed.
[[nodiscard]] bool evaluate_condition(const ConditionConfig& condition, const Value& input);

/// Emits {input, path: "true"|"false", conditionResult} and follows only the
/// edges leaving through the matching handle
class ConditionalNode : public NodeBase {
public:
    ConditionalNode(NodeDescriptor descriptor, std::shared_ptr<IConfigStore> configs = nullptr);

    [[nodiscard]] ExecuteResult execute(ExecutionContext& ctx, const Value& input) override;

    [[nodiscard]] std::vector<NodeId> select_children(
        ExecutionContext& ctx, const Value& output) const override;
};

// =============================================================================
// Group
// =============================================================================

/// Runs the sub-pipeline of nodes parented to it and returns the flattened
/// outputs of its internal leaves
class GroupNode : public NodeBase {
public:
    GroupNode(NodeDescriptor descriptor, std::shared_ptr<IConfigStore> configs = nullptr);

    [[nodiscard]] ExecuteResult execute(ExecutionContext& ctx, const Value& input) override;

protected:
    void store_result(ExecutionContext& ctx, const Value& output) override;
};

// =============================================================================
// Merger
// =============================================================================

struct MergerConfig {
    enum class Strategy : std::uint8_t { Array, Object };

    Strategy strategy = Strategy::Array;
    std::vector<std::string> keys;

    [[nodiscard]] static MergerConfig from_json(const Value& config);
};

/// Accumulates every arrival for the lifetime of the instance and re-emits the
/// whole collection each time
class MergerNode : public NodeBase {
public:
    MergerNode(NodeDescriptor descriptor, std::shared_ptr<IConfigStore> configs = nullptr);

    [[nodiscard]] ExecuteResult execute(ExecutionContext& ctx, const Value& input) override;

    void reset();
    [[nodiscard]] std::vector<Value> items() const;

    /// Key for item at index under the object strategy
    [[nodiscard]] static std::string item_key(const Value& item, std::size_t index, const std::vector<std::string>& keys);

private:
    mutable std::mutex mutex_;
    std::vector<Value> items_;
};

} // namespace flow_nodes
