/// @file merger.cpp
/// @brief MergerNode: fan-in accumulation

#include <flow_engine/nodes/control.hpp>

namespace flow_nodes {

MergerConfig MergerConfig::from_json(const Value& config) {
    MergerConfig merger;
    if (!config.is_object()) {
        return merger;
    }

    std::string strategy = config.value("strategy", config.value("mergeStrategy", std::string("array")));
    if (strategy == "object") {
        merger.strategy = Strategy::Object;
    }

    if (auto keys = config.find("keys"); keys != config.end() && keys->is_array()) {
        for (const auto& key : *keys) {
            if (key.is_string()) {
                merger.keys.push_back(key.get<std::string>());
            }
        }
    }
    return merger;
}

MergerNode::MergerNode(NodeDescriptor descriptor, std::shared_ptr<IConfigStore> configs)
    : NodeBase(std::move(descriptor), std::move(configs))
{
}

std::string MergerNode::item_key(const Value& item, std::size_t index, const std::vector<std::string>& keys) {
    if (item.is_object()) {
        for (const auto& key : keys) {
            if (auto it = item.find(key); it != item.end() && !it->is_null()) {
                return flow_core::to_display_string(*it);
            }
        }
        if (auto it = item.find("id"); it != item.end() && !it->is_null()) {
            return flow_core::to_display_string(*it);
        }
    }
    return "item_" + std::to_string(index);
}

ExecuteResult MergerNode::execute(ExecutionContext& ctx, const Value& input) {
    auto config = MergerConfig::from_json(current_config());

    std::vector<Value> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (input.is_array()) {
            for (const auto& element : input) {
                items_.push_back(element);
            }
        } else {
            items_.push_back(input);
        }
        snapshot = items_;
    }

    ctx.log("Merger(" + id() + "): " + std::to_string(snapshot.size()) + " items collected");

    if (config.strategy == MergerConfig::Strategy::Object) {
        Value merged = Value::object();
        for (std::size_t i = 0; i < snapshot.size(); ++i) {
            merged[item_key(snapshot[i], i, config.keys)] = snapshot[i];
        }
        return emit(std::move(merged));
    }

    Value merged = Value::array();
    for (auto& item : snapshot) {
        merged.push_back(std::move(item));
    }
    return emit(std::move(merged));
}

void MergerNode::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.clear();
}

std::vector<Value> MergerNode::items() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_;
}

} // namespace flow_nodes
