#pragma once

/// @file crawler.hpp
/// @brief Web crawling and HTML extraction collaborators
///
/// Both are served by the backend: the crawler renders a page in a headless
/// browser, the parser applies CSS-selector extraction rules to HTML.

#include "http.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace flow_services {

// =============================================================================
// Web Crawler
// =============================================================================

struct CrawlRequest {
    std::string url;
    std::string wait_for_selector = "body";
    int timeout_ms = 5000;
    std::map<std::string, std::string> extract_selectors;  // name -> CSS selector
    std::map<std::string, std::string> headers;
};

struct CrawlResult {
    std::string url;
    std::string title;
    std::string html;
    std::string text;
    nlohmann::json extracted = nlohmann::json::object();
    nlohmann::json raw = nlohmann::json::object();  // Full backend payload
};

class IWebCrawler {
public:
    virtual ~IWebCrawler() = default;

    [[nodiscard]] virtual flow_core::Result<CrawlResult> crawl(const CrawlRequest& request) = 0;
};

/// POST {backend_url}/api/crawl -> {success, result, error}
class BackendWebCrawler : public IWebCrawler {
public:
    BackendWebCrawler(std::shared_ptr<IHttpClient> http, std::string backend_url);

    [[nodiscard]] flow_core::Result<CrawlResult> crawl(const CrawlRequest& request) override;

private:
    std::shared_ptr<IHttpClient> m_http;
    std::string m_backend_url;
};

// =============================================================================
// HTML Parser
// =============================================================================

enum class ExtractTarget : std::uint8_t {
    Text,
    Attribute,
    Html,
};

[[nodiscard]] std::optional<ExtractTarget> parse_extract_target(const std::string& name);
[[nodiscard]] const char* extract_target_name(ExtractTarget target);

struct ExtractionRule {
    std::string name;
    std::string selector;
    ExtractTarget target = ExtractTarget::Text;
    std::string attribute;  // For ExtractTarget::Attribute
    bool multiple = false;
};

/// Returns {rule.name: value | [values] | null}
class IHtmlParser {
public:
    virtual ~IHtmlParser() = default;

    [[nodiscard]] virtual flow_core::Result<nlohmann::json> extract(
        const std::string& html, const std::vector<ExtractionRule>& rules) = 0;
};

/// POST {backend_url}/api/html/parse -> {success, result, error}
class BackendHtmlParser : public IHtmlParser {
public:
    BackendHtmlParser(std::shared_ptr<IHttpClient> http, std::string backend_url);

    [[nodiscard]] flow_core::Result<nlohmann::json> extract(
        const std::string& html, const std::vector<ExtractionRule>& rules) override;

private:
    std::shared_ptr<IHttpClient> m_http;
    std::string m_backend_url;
};

} // namespace flow_services
