#pragma once

/// @file transform.hpp
/// @brief Leaf transform nodes backed by external collaborators

#include "control.hpp"

#include <flow_engine/services/services.hpp>

#include <map>
#include <string>
#include <vector>

namespace flow_nodes {

// =============================================================================
// JSON Extractor
// =============================================================================

struct JsonExtractorConfig {
    std::string path;
    Value default_value = nullptr;

    [[nodiscard]] static JsonExtractorConfig from_json(const Value& config);
};

class JsonExtractorNode : public NodeBase {
public:
    JsonExtractorNode(NodeDescriptor descriptor, std::shared_ptr<IConfigStore> configs = nullptr);

    [[nodiscard]] ExecuteResult execute(ExecutionContext& ctx, const Value& input) override;
};

// =============================================================================
// API
// =============================================================================

struct ApiConfig {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> query_params;
    std::optional<std::string> body;  // Verbatim request body when configured

    [[nodiscard]] static ApiConfig from_json(const Value& config);
};

/// Issues one HTTP request per arrival
class ApiNode : public NodeBase {
public:
    ApiNode(NodeDescriptor descriptor, std::shared_ptr<flow_services::IHttpClient> http,
            std::shared_ptr<IConfigStore> configs = nullptr);

    [[nodiscard]] ExecuteResult execute(ExecutionContext& ctx, const Value& input) override;

private:
    std::shared_ptr<flow_services::IHttpClient> http_;
};

// =============================================================================
// LLM
// =============================================================================

struct LlmConfig {
    enum class Mode : std::uint8_t { Text, Vision };

    flow_services::LlmProvider provider = flow_services::LlmProvider::Ollama;
    std::string model = "llama3";
    std::string prompt;
    double temperature = 0.7;
    Mode mode = Mode::Text;

    [[nodiscard]] static flow_core::Result<LlmConfig> from_json(const NodeId& node_id, const Value& config);
};

/// Replace every {{input}} in the template with the rendered input
[[nodiscard]] std::string render_prompt(const std::string& prompt, const Value& input);

/// Image file paths found in the input (string, string array, or objects with
/// a "path" field), keeping only known image extensions
[[nodiscard]] std::vector<std::string> collect_image_paths(const Value& input);

class LlmNode : public NodeBase {
public:
    LlmNode(NodeDescriptor descriptor, flow_services::ServiceSet services,
            std::shared_ptr<IConfigStore> configs = nullptr);

    [[nodiscard]] ExecuteResult execute(ExecutionContext& ctx, const Value& input) override;

private:
    flow_services::ServiceSet services_;
};

// =============================================================================
// Web Crawler
// =============================================================================

struct WebCrawlerConfig {
    enum class OutputFormat : std::uint8_t { Full, Html, Text, Extracted };

    std::string url;
    std::string wait_for_selector = "body";
    int timeout_ms = 5000;
    OutputFormat output_format = OutputFormat::Full;
    std::map<std::string, std::string> extract_selectors;
    std::map<std::string, std::string> headers;

    [[nodiscard]] static WebCrawlerConfig from_json(const Value& config);
};

class WebCrawlerNode : public NodeBase {
public:
    WebCrawlerNode(NodeDescriptor descriptor, std::shared_ptr<flow_services::IWebCrawler> crawler,
                   std::shared_ptr<IConfigStore> configs = nullptr);

    [[nodiscard]] ExecuteResult execute(ExecutionContext& ctx, const Value& input) override;

private:
    std::shared_ptr<flow_services::IWebCrawler> crawler_;
};

// =============================================================================
// HTML Parser
// =============================================================================

struct HtmlParserConfig {
    std::vector<flow_services::ExtractionRule> rules;

    [[nodiscard]] static flow_core::Result<HtmlParserConfig> from_json(const NodeId& node_id, const Value& config);
};

class HtmlParserNode : public NodeBase {
public:
    HtmlParserNode(NodeDescriptor descriptor, std::shared_ptr<flow_services::IHtmlParser> parser,
                   std::shared_ptr<IConfigStore> configs = nullptr);

    [[nodiscard]] ExecuteResult execute(ExecutionContext& ctx, const Value& input) override;

private:
    std::shared_ptr<flow_services::IHtmlParser> parser_;
};

} // namespace flow_nodes
