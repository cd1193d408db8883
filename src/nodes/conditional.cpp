/// @file conditional.cpp
/// @brief ConditionalNode: predicate evaluation and handle-based branching

#include <flow_engine/nodes/control.hpp>
#include <flow_engine/core/log.hpp>

#include <algorithm>

namespace flow_nodes {

namespace handles = flow_graph::handles;

// =============================================================================
// Condition Types
// =============================================================================

const char* to_string(ConditionType type) {
    switch (type) {
        case ConditionType::NumberGreaterThan: return "numberGreaterThan";
        case ConditionType::NumberLessThan: return "numberLessThan";
        case ConditionType::EqualTo: return "equalTo";
        case ConditionType::ContainsSubstring: return "containsSubstring";
        case ConditionType::JsonPathExistsTruthy: return "jsonPathExistsTruthy";
        default: return "equalTo";
    }
}

std::optional<ConditionType> parse_condition_type(const std::string& name) {
    if (name == "numberGreaterThan" || name == "greater_than") return ConditionType::NumberGreaterThan;
    if (name == "numberLessThan" || name == "less_than") return ConditionType::NumberLessThan;
    if (name == "equalTo" || name == "equal_to") return ConditionType::EqualTo;
    if (name == "containsSubstring" || name == "contains") return ConditionType::ContainsSubstring;
    if (name == "jsonPathExistsTruthy" || name == "json_path") return ConditionType::JsonPathExistsTruthy;
    return std::nullopt;
}

ConditionConfig ConditionConfig::from_json(const Value& config) {
    ConditionConfig condition;
    if (!config.is_object()) {
        return condition;
    }

    const Value* source = &config;
    if (auto nested = config.find("condition"); nested != config.end() && nested->is_object()) {
        source = &*nested;
    }

    const Value* type_field = nullptr;
    for (const char* key : {"conditionType", "type"}) {
        if (auto it = source->find(key); it != source->end() && it->is_string()) {
            type_field = &*it;
            break;
        }
    }
    const Value* value_field = nullptr;
    for (const char* key : {"conditionValue", "value"}) {
        if (auto it = source->find(key); it != source->end() && !it->is_null()) {
            value_field = &*it;
            break;
        }
    }

    // Nothing configured: equals true
    if (!type_field && !value_field) {
        return condition;
    }

    if (type_field) {
        const auto& name = type_field->get_ref<const std::string&>();
        if (auto parsed = parse_condition_type(name)) {
            condition.type = *parsed;
        } else {
            flow_core::node_logger()->warn("Unknown condition type '{}', falling back to equalTo", name);
            condition.type = ConditionType::EqualTo;
        }
    }
    condition.value = value_field ? *value_field : Value("");
    return condition;
}

// =============================================================================
// Evaluation
// =============================================================================

namespace {

bool compare_numbers(const Value& lhs, const Value& rhs, bool greater) {
    auto a = flow_core::coerce_number(lhs);
    auto b = flow_core::coerce_number(rhs);
    if (!a || !b) {
        return false;
    }
    return greater ? *a > *b : *a < *b;
}

} // anonymous namespace

bool evaluate_condition(const ConditionConfig& condition, const Value& input) {
    try {
        switch (condition.type) {
            case ConditionType::NumberGreaterThan:
                return compare_numbers(input, condition.value, true);
            case ConditionType::NumberLessThan:
                return compare_numbers(input, condition.value, false);
            case ConditionType::EqualTo:
                return flow_core::values_equal(input, condition.value);
            case ConditionType::ContainsSubstring:
                return flow_core::to_display_string(input).find(
                    flow_core::to_display_string(condition.value)) != std::string::npos;
            case ConditionType::JsonPathExistsTruthy: {
                const Value* found = flow_core::lookup_path(input, flow_core::to_display_string(condition.value));
                return found != nullptr && flow_core::is_truthy(*found);
            }
            default:
                return false;
        }
    } catch (const std::exception& e) {
        flow_core::node_logger()->warn("Condition {} evaluation failed, treating as false: {}",
            to_string(condition.type), e.what());
        return false;
    }
}

// =============================================================================
// ConditionalNode
// =============================================================================

ConditionalNode::ConditionalNode(NodeDescriptor descriptor, std::shared_ptr<IConfigStore> configs)
    : NodeBase(std::move(descriptor), std::move(configs))
{
}

ExecuteResult ConditionalNode::execute(ExecutionContext& ctx, const Value& input) {
    auto condition = ConditionConfig::from_json(current_config());
    bool result = evaluate_condition(condition, input);

    ctx.log("Conditional(" + id() + "): " + to_string(condition.type) + " " +
        flow_core::to_display_string(condition.value) + " -> " + (result ? "true" : "false"));

    Value output = Value::object();
    output["input"] = input;
    output["path"] = result ? "true" : "false";
    output["conditionResult"] = result;
    return emit(std::move(output));
}

std::vector<NodeId> ConditionalNode::select_children(ExecutionContext& ctx, const Value& output) const {
    const bool taken = output.is_object() && output.value("path", std::string("false")) == "true";

    const std::string legacy_true = handles::legacy(id(), true);
    const std::string legacy_false = handles::legacy(id(), false);

    std::vector<NodeId> selected;
    std::vector<NodeId> not_taken;
    for (const auto& edge : ctx.graph().outgoing(id())) {
        const bool is_true = edge.source_handle == handles::True || edge.source_handle == legacy_true;
        const bool is_false = edge.source_handle == handles::False || edge.source_handle == legacy_false;

        if ((taken && is_true) || (!taken && is_false)) {
            if (std::find(selected.begin(), selected.end(), edge.target) == selected.end()) {
                selected.push_back(edge.target);
            }
        } else if (is_true || is_false) {
            not_taken.push_back(edge.target);
        }
    }

    for (const auto& target : not_taken) {
        bool also_selected = std::find(selected.begin(), selected.end(), target) != selected.end();
        if (!also_selected && ctx.node_state(target).status == flow_graph::NodeStatus::Idle) {
            ctx.mark_skipped(target);
        }
    }

    return selected;
}

} // namespace flow_nodes
