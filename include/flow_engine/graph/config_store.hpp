#pragma once

/// @file config_store.hpp
/// @brief Node configuration lookup keyed by node id
///
/// Nodes read their configuration from the store at the start of every
/// execution, so edits made between runs apply without rebuilding nodes.

#include "types.hpp"

#include <mutex>
#include <optional>
#include <unordered_map>

namespace flow_graph {

/// Interface for the configuration lookup collaborator
class IConfigStore {
public:
    virtual ~IConfigStore() = default;

    [[nodiscard]] virtual std::optional<Value> get(const NodeId& id) const = 0;

    virtual void set(const NodeId& id, Value config) = 0;

    /// RFC 7386 merge of patch into the stored entry (created if absent)
    virtual void merge(const NodeId& id, const Value& patch) = 0;
};

/// Thread-safe in-memory store
class ConfigStore : public IConfigStore {
public:
    ConfigStore() = default;

    [[nodiscard]] std::optional<Value> get(const NodeId& id) const override;
    void set(const NodeId& id, Value config) override;
    void merge(const NodeId& id, const Value& patch) override;

    /// Load {nodeId: config, ...}; non-object entries are ignored
    void load(const Value& configs);

    [[nodiscard]] Value to_json() const;
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<NodeId, Value> entries_;
};

} // namespace flow_graph
