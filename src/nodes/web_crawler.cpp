/// @file web_crawler.cpp
/// @brief WebCrawlerNode: page fetch through the crawling backend

#include <flow_engine/nodes/transform.hpp>

#include <algorithm>
#include <limits>

namespace flow_nodes {

using flow_core::NodeError;

namespace {

std::map<std::string, std::string> read_selectors(const Value& config, const char* key) {
    std::map<std::string, std::string> selectors;
    auto it = config.find(key);
    if (it == config.end()) {
        return selectors;
    }
    if (it->is_object()) {
        for (const auto& [name, selector] : it->items()) {
            if (selector.is_string()) {
                selectors[name] = selector.get<std::string>();
            }
        }
    } else if (it->is_array()) {
        // [{name, selector}, ...] as stored by the editor
        for (const auto& entry : *it) {
            if (entry.is_object() && entry.contains("name") && entry.contains("selector") &&
                entry["name"].is_string() && entry["selector"].is_string()) {
                selectors[entry["name"].get<std::string>()] = entry["selector"].get<std::string>();
            }
        }
    }
    return selectors;
}

} // anonymous namespace

WebCrawlerConfig WebCrawlerConfig::from_json(const Value& config) {
    WebCrawlerConfig crawler;
    if (!config.is_object()) {
        return crawler;
    }

    crawler.url = config.value("url", std::string());

    std::string selector = config.value("waitForSelector", std::string());
    if (!selector.empty()) {
        crawler.wait_for_selector = selector;
    }

    if (auto timeout = config.find("timeout"); timeout != config.end()) {
        if (auto number = flow_core::coerce_number(*timeout); number && *number >= 0) {
            constexpr double kMaxTimeout = static_cast<double>(std::numeric_limits<int>::max());
            crawler.timeout_ms = static_cast<int>(std::min(*number, kMaxTimeout));
        }
    }

    std::string format = config.value("outputFormat", std::string("full"));
    if (format == "html") {
        crawler.output_format = OutputFormat::Html;
    } else if (format == "text") {
        crawler.output_format = OutputFormat::Text;
    } else if (format == "extracted") {
        crawler.output_format = OutputFormat::Extracted;
    }

    crawler.extract_selectors = read_selectors(config, "extractSelectors");
    crawler.headers = read_selectors(config, "headers");
    return crawler;
}

WebCrawlerNode::WebCrawlerNode(NodeDescriptor descriptor, std::shared_ptr<flow_services::IWebCrawler> crawler,
                               std::shared_ptr<IConfigStore> configs)
    : NodeBase(std::move(descriptor), std::move(configs))
    , crawler_(std::move(crawler))
{
}

ExecuteResult WebCrawlerNode::execute(ExecutionContext& ctx, const Value& input) {
    auto config = WebCrawlerConfig::from_json(current_config());

    if (config.url.empty() && input.is_string() && input.get_ref<const std::string&>().rfind("http", 0) == 0) {
        config.url = input.get<std::string>();
    }
    if (config.url.empty()) {
        return fail(NodeError::configuration(id(), "url"));
    }
    if (!crawler_) {
        return fail(NodeError::invalid_configuration(id(), "no crawler available"));
    }

    flow_services::CrawlRequest request;
    request.url = config.url;
    request.wait_for_selector = config.wait_for_selector;
    request.timeout_ms = config.timeout_ms;
    request.extract_selectors = config.extract_selectors;
    request.headers = config.headers;

    ctx.log("WebCrawler(" + id() + "): " + request.url);

    auto result = crawler_->crawl(request);
    if (!result) {
        return fail(NodeError::transform(id(), flow_core::build_error_chain(result.error())));
    }

    switch (config.output_format) {
        case WebCrawlerConfig::OutputFormat::Html:
            return emit(Value(result->html));
        case WebCrawlerConfig::OutputFormat::Text:
            return emit(Value(result->text));
        case WebCrawlerConfig::OutputFormat::Extracted:
            return emit(result->extracted);
        case WebCrawlerConfig::OutputFormat::Full:
        default:
            return emit(Value{
                {"url", result->url},
                {"title", result->title},
                {"html", result->html},
                {"text", result->text},
                {"extracted", result->extracted},
            });
    }
}

} // namespace flow_nodes
