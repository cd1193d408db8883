/// @file builtin.cpp
/// @brief Built-in node registration

#include <flow_engine/nodes/builtin.hpp>
#include <flow_engine/core/log.hpp>

namespace flow_nodes {

namespace types = flow_graph::node_types;
using flow_graph::INode;

void register_builtin_nodes(flow_graph::NodeRegistry& registry, const NodeServices& services) {
    auto configs = services.configs;
    const auto& set = services.services;

    registry.register_type(types::Input, [configs](const NodeDescriptor& d) -> std::unique_ptr<INode> {
        return std::make_unique<InputNode>(d, configs);
    });
    registry.register_type(types::Output, [configs](const NodeDescriptor& d) -> std::unique_ptr<INode> {
        return std::make_unique<OutputNode>(d, configs);
    });
    registry.register_type(types::Conditional, [configs](const NodeDescriptor& d) -> std::unique_ptr<INode> {
        return std::make_unique<ConditionalNode>(d, configs);
    });
    registry.register_type(types::Group, [configs](const NodeDescriptor& d) -> std::unique_ptr<INode> {
        return std::make_unique<GroupNode>(d, configs);
    });
    registry.register_type(types::Merger, [configs](const NodeDescriptor& d) -> std::unique_ptr<INode> {
        return std::make_unique<MergerNode>(d, configs);
    });
    registry.register_type(types::JsonExtractor, [configs](const NodeDescriptor& d) -> std::unique_ptr<INode> {
        return std::make_unique<JsonExtractorNode>(d, configs);
    });

    auto http = set.http;
    registry.register_type(types::Api, [configs, http](const NodeDescriptor& d) -> std::unique_ptr<INode> {
        return std::make_unique<ApiNode>(d, http, configs);
    });
    registry.register_type(types::Llm, [configs, set](const NodeDescriptor& d) -> std::unique_ptr<INode> {
        return std::make_unique<LlmNode>(d, set, configs);
    });
    auto crawler = set.crawler;
    registry.register_type(types::WebCrawler, [configs, crawler](const NodeDescriptor& d) -> std::unique_ptr<INode> {
        return std::make_unique<WebCrawlerNode>(d, crawler, configs);
    });
    auto parser = set.html_parser;
    registry.register_type(types::HtmlParser, [configs, parser](const NodeDescriptor& d) -> std::unique_ptr<INode> {
        return std::make_unique<HtmlParserNode>(d, parser, configs);
    });

    flow_core::engine_logger()->debug("Registered {} built-in node types", registry.size());
}

std::shared_ptr<flow_graph::NodeRegistry> make_builtin_registry(const NodeServices& services) {
    auto registry = std::make_shared<flow_graph::NodeRegistry>();
    register_builtin_nodes(*registry, services);
    return registry;
}

} // namespace flow_nodes
