#pragma once

/// @file http.hpp
/// @brief HTTP client interface and libcurl implementation

#include <flow_engine/core/config.hpp>
#include <flow_engine/core/error.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>

namespace flow_services {

// =============================================================================
// Request / Response
// =============================================================================

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> query;
    std::string body;
};

struct HttpResponse {
    int status_code = 0;
    std::string status_message;  // reason phrase of the final status line
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    [[nodiscard]] bool is_success() const { return status_code >= 200 && status_code < 300; }

    /// Case-insensitive header lookup
    [[nodiscard]] std::string get_header(const std::string& name) const;

    [[nodiscard]] std::string content_type() const { return get_header("Content-Type"); }
    [[nodiscard]] bool is_json() const;
};

// =============================================================================
// HTTP Client Interface
// =============================================================================

/// Transport failures are errors; any HTTP status (including 4xx/5xx) is a response
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    [[nodiscard]] virtual flow_core::Result<HttpResponse> send(const HttpRequest& request) = 0;
};

/// Append url-encoded query parameters to url
[[nodiscard]] std::string build_url(const std::string& url, const std::map<std::string, std::string>& query);

/// Create HTTP client using libcurl
[[nodiscard]] std::shared_ptr<IHttpClient> create_curl_client(const flow_core::ServiceConfig& config);

} // namespace flow_services
