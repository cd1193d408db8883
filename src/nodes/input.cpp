/// @file input.cpp
/// @brief InputNode: item collections, batch emission and foreach iteration

#include <flow_engine/nodes/io.hpp>

#include <sstream>

namespace flow_nodes {

// =============================================================================
// InputConfig
// =============================================================================

namespace {

std::vector<Value> read_list(const Value& config, const char* key) {
    std::vector<Value> items;
    if (auto it = config.find(key); it != config.end() && it->is_array()) {
        items.assign(it->begin(), it->end());
    }
    return items;
}

bool has_list(const Value& config, const char* key) {
    auto it = config.find(key);
    return it != config.end() && it->is_array();
}

std::vector<Value> split_lines(const std::string& text) {
    std::vector<Value> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        auto first = line.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            continue;
        }
        auto last = line.find_last_not_of(" \t\r\n");
        lines.emplace_back(line.substr(first, last - first + 1));
    }
    return lines;
}

Value to_array(const std::vector<Value>& items) {
    Value array = Value::array();
    for (const auto& item : items) {
        array.push_back(item);
    }
    return array;
}

} // anonymous namespace

std::optional<InputConfig::ChainingUpdate> parse_chaining_update(const std::string& name) {
    using U = InputConfig::ChainingUpdate;
    if (name == "common") return U::Common;
    if (name == "replaceCommon") return U::ReplaceCommon;
    if (name == "element") return U::Element;
    if (name == "replaceElement") return U::ReplaceElement;
    if (name == "none") return U::None;
    return std::nullopt;
}

std::optional<InputConfig::Accumulation> parse_accumulation(const std::string& name) {
    using A = InputConfig::Accumulation;
    if (name == "always") return A::Always;
    if (name == "oncePerContext") return A::OncePerContext;
    if (name == "none") return A::None;
    return std::nullopt;
}

InputConfig InputConfig::from_json(const Value& config) {
    InputConfig input;
    if (!config.is_object()) {
        return input;
    }

    std::string mode = config.value("executionMode", std::string());
    if (mode == "foreach") {
        input.mode = Mode::Foreach;
    } else if (mode.empty() && config.value("iterateEachRow", false)) {
        input.mode = Mode::Foreach;
    }

    if (auto update = parse_chaining_update(config.value("chainingUpdateMode", std::string()))) {
        input.chaining_update = *update;
    }
    if (auto accumulation = parse_accumulation(config.value("accumulationMode", std::string()))) {
        input.accumulation = *accumulation;
    }

    input.chaining_items = read_list(config, "chainingItems");
    input.common_items = read_list(config, "commonItems");
    input.element_items = has_list(config, "elementItems")
        ? read_list(config, "elementItems")
        : read_list(config, "items");

    if (input.common_items.empty() && input.element_items.empty()) {
        for (const char* key : {"textBuffer", "text"}) {
            if (auto it = config.find(key); it != config.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
                input.element_items = split_lines(it->get<std::string>());
                break;
            }
        }
    }
    return input;
}

Value InputConfig::items_json() const {
    return Value{
        {"chainingItems", to_array(chaining_items)},
        {"commonItems", to_array(common_items)},
        {"elementItems", to_array(element_items)},
    };
}

std::vector<Value> InputConfig::combined_items() const {
    std::vector<Value> items = common_items;
    items.insert(items.end(), element_items.begin(), element_items.end());
    return items;
}

// =============================================================================
// InputNode
// =============================================================================

InputNode::InputNode(NodeDescriptor descriptor, std::shared_ptr<IConfigStore> configs)
    : NodeBase(std::move(descriptor), std::move(configs))
{
}

InputConfig InputNode::effective_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Value raw = current_config();
    raw.merge_patch(overlay_);
    return InputConfig::from_json(raw);
}

void InputNode::accumulate(ExecutionContext& ctx, InputConfig& config, const Value& input) {
    if (input.is_null() || config.accumulation == InputConfig::Accumulation::None) {
        return;
    }
    if (config.accumulation == InputConfig::Accumulation::OncePerContext &&
        !ctx.mark_node_executed("input-accumulated:" + id())) {
        return;
    }

    std::vector<Value> received;
    if (input.is_array()) {
        received.assign(input.begin(), input.end());
    } else {
        received.push_back(input);
    }

    config.chaining_items.insert(config.chaining_items.end(), received.begin(), received.end());

    switch (config.chaining_update) {
        case InputConfig::ChainingUpdate::Common:
            config.common_items.insert(config.common_items.end(), received.begin(), received.end());
            break;
        case InputConfig::ChainingUpdate::ReplaceCommon:
            config.common_items = received;
            break;
        case InputConfig::ChainingUpdate::Element:
            config.element_items.insert(config.element_items.end(), received.begin(), received.end());
            break;
        case InputConfig::ChainingUpdate::ReplaceElement:
            config.element_items = received;
            break;
        case InputConfig::ChainingUpdate::None:
            break;
    }

    Value patch = config.items_json();
    if (configs_) {
        configs_->merge(id(), patch);
    } else {
        overlay_.merge_patch(patch);
    }
}

ExecuteResult InputNode::execute(ExecutionContext& ctx, const Value& input) {
    std::vector<Value> items;
    InputConfig::Mode mode;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Value raw = current_config();
        raw.merge_patch(overlay_);
        InputConfig config = InputConfig::from_json(raw);
        accumulate(ctx, config, input);
        items = config.combined_items();
        mode = config.mode;
    }

    if (mode == InputConfig::Mode::Batch) {
        ctx.log("Input(" + id() + "): batch of " + std::to_string(items.size()) + " items");
        return emit(to_array(items));
    }

    const auto children = ctx.graph().children_of(id());
    const std::size_t total = items.size();
    ctx.log("Input(" + id() + "): foreach over " + std::to_string(total) + " items, " +
        std::to_string(children.size()) + " children");

    for (std::size_t i = 0; i < total; ++i) {
        auto iteration = ctx.create_iteration_context(i, total, items[i]);
        for (const auto& child : children) {
            fan_out(*iteration, {child}, items[i]);
        }
    }

    return stop();
}

} // namespace flow_nodes
