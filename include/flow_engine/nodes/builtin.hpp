#pragma once

/// @file builtin.hpp
/// @brief Registration of the built-in node kinds

#include "control.hpp"
#include "io.hpp"
#include "transform.hpp"

#include <flow_engine/graph/registry.hpp>

#include <memory>

namespace flow_nodes {

/// Collaborators shared by every constructed node
struct NodeServices {
    std::shared_ptr<IConfigStore> configs;
    flow_services::ServiceSet services;
};

/// Register input, output, api, llm, json-extractor, web-crawler,
/// html-parser, conditional, group and merger
void register_builtin_nodes(flow_graph::NodeRegistry& registry, const NodeServices& services);

[[nodiscard]] std::shared_ptr<flow_graph::NodeRegistry> make_builtin_registry(const NodeServices& services);

} // namespace flow_nodes
