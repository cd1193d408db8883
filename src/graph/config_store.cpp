/// @file config_store.cpp
/// @brief In-memory node configuration store

#include <flow_engine/graph/config_store.hpp>

namespace flow_graph {

std::optional<Value> ConfigStore::get(const NodeId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ConfigStore::set(const NodeId& id, Value config) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[id] = std::move(config);
}

void ConfigStore::merge(const NodeId& id, const Value& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entries_[id];
    if (!entry.is_object()) {
        entry = Value::object();
    }
    entry.merge_patch(patch);
}

void ConfigStore::load(const Value& configs) {
    if (!configs.is_object()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = configs.begin(); it != configs.end(); ++it) {
        if (it.value().is_object()) {
            entries_[it.key()] = it.value();
        }
    }
}

Value ConfigStore::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Value out = Value::object();
    for (const auto& [id, config] : entries_) {
        out[id] = config;
    }
    return out;
}

std::size_t ConfigStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace flow_graph
