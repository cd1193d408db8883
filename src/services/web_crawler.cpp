/// @file web_crawler.cpp
/// @brief Backend-served web crawler and HTML parser clients

#include <flow_engine/services/crawler.hpp>
#include <flow_engine/core/log.hpp>

namespace flow_services {

using flow_core::Err;
using flow_core::Error;
using flow_core::ErrorCode;
using flow_core::Result;
using json = nlohmann::json;

namespace {

std::string trim_base(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

std::string string_or_empty(const json& obj, const char* key) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_string() ? it->get<std::string>() : std::string{};
}

/// Unwrap the backend envelope {success, result, error}
Result<json> post_backend(IHttpClient& http, const std::string& url, const json& body, const char* what) {
    HttpRequest request;
    request.method = "POST";
    request.url = url;
    request.headers["Content-Type"] = "application/json";
    request.body = body.dump();

    auto response = http.send(request);
    if (!response) {
        return Err<json>(response.error());
    }
    if (!response->is_success()) {
        return Err<json>(Error(ErrorCode::ExternalFailure,
            std::string(what) + " backend returned HTTP " + std::to_string(response->status_code))
            .with_context("url", url));
    }

    json payload;
    try {
        payload = json::parse(response->body);
    } catch (const json::parse_error& e) {
        return Err<json>(Error(ErrorCode::ParseError, std::string(what) + " backend returned invalid JSON: " + e.what()));
    }

    if (!payload.is_object()) {
        return Err<json>(Error(ErrorCode::ParseError, std::string(what) + " backend returned a non-object payload"));
    }

    if (auto success = payload.find("success"); success != payload.end() && success->is_boolean() && !success->get<bool>()) {
        std::string message = string_or_empty(payload, "error");
        return Err<json>(Error(ErrorCode::ExternalFailure,
            std::string(what) + " failed: " + (message.empty() ? "unknown error" : message)));
    }

    if (auto result = payload.find("result"); result != payload.end() && !result->is_null()) {
        return *result;
    }
    return payload;
}

} // anonymous namespace

// =============================================================================
// BackendWebCrawler
// =============================================================================

BackendWebCrawler::BackendWebCrawler(std::shared_ptr<IHttpClient> http, std::string backend_url)
    : m_http(std::move(http))
    , m_backend_url(trim_base(std::move(backend_url)))
{
}

Result<CrawlResult> BackendWebCrawler::crawl(const CrawlRequest& request) {
    json body = {
        {"url", request.url},
        {"selector", request.wait_for_selector.empty() ? "body" : request.wait_for_selector},
        {"waitBeforeLoad", request.timeout_ms},
    };
    if (!request.extract_selectors.empty()) {
        body["extract_selectors"] = request.extract_selectors;
    }
    if (!request.headers.empty()) {
        body["headers"] = request.headers;
    }

    flow_core::service_logger()->info("Crawling {}", request.url);

    auto payload = post_backend(*m_http, m_backend_url + "/api/crawl", body, "Crawl");
    if (!payload) {
        return Err<CrawlResult>(payload.error().with_context("target", request.url));
    }

    const json& raw = *payload;
    CrawlResult result;
    result.raw = raw;

    if (raw.is_string()) {
        // Older backends answer with bare HTML
        result.url = request.url;
        result.html = raw.get<std::string>();
        return result;
    }
    if (!raw.is_object()) {
        return Err<CrawlResult>(Error(ErrorCode::ParseError, "Crawl backend returned an unexpected payload"));
    }
    if (string_or_empty(raw, "status") == "error") {
        return Err<CrawlResult>(Error(ErrorCode::ExternalFailure,
            "Crawl failed: " + string_or_empty(raw, "error")).with_context("target", request.url));
    }

    result.url = string_or_empty(raw, "url");
    if (result.url.empty()) {
        result.url = request.url;
    }
    result.title = string_or_empty(raw, "title");
    result.html = string_or_empty(raw, "html");
    result.text = string_or_empty(raw, "text");
    if (auto extracted = raw.find("extracted_data"); extracted != raw.end() && extracted->is_object()) {
        result.extracted = *extracted;
    }
    return result;
}

// =============================================================================
// BackendHtmlParser
// =============================================================================

std::optional<ExtractTarget> parse_extract_target(const std::string& name) {
    if (name == "text") return ExtractTarget::Text;
    if (name == "attribute") return ExtractTarget::Attribute;
    if (name == "html") return ExtractTarget::Html;
    return std::nullopt;
}

const char* extract_target_name(ExtractTarget target) {
    switch (target) {
        case ExtractTarget::Text: return "text";
        case ExtractTarget::Attribute: return "attribute";
        case ExtractTarget::Html: return "html";
        default: return "text";
    }
}

BackendHtmlParser::BackendHtmlParser(std::shared_ptr<IHttpClient> http, std::string backend_url)
    : m_http(std::move(http))
    , m_backend_url(trim_base(std::move(backend_url)))
{
}

Result<json> BackendHtmlParser::extract(const std::string& html, const std::vector<ExtractionRule>& rules) {
    json wire_rules = json::array();
    for (const auto& rule : rules) {
        json wire = {
            {"name", rule.name},
            {"selector", rule.selector},
            {"target", extract_target_name(rule.target)},
            {"multiple", rule.multiple},
        };
        if (rule.target == ExtractTarget::Attribute) {
            wire["attribute_name"] = rule.attribute;
        }
        wire_rules.push_back(std::move(wire));
    }

    json body = {{"html", html}, {"rules", wire_rules}};

    auto payload = post_backend(*m_http, m_backend_url + "/api/html/parse", body, "HTML parse");
    if (!payload) {
        return payload;
    }
    if (!payload->is_object()) {
        return Err<json>(Error(ErrorCode::ParseError, "HTML parse backend returned a non-object result"));
    }
    return payload;
}

} // namespace flow_services
