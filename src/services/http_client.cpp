/// @file http_client.cpp
/// @brief libcurl-backed IHttpClient plus URL and header helpers

#include <flow_engine/services/http.hpp>
#include <flow_engine/core/log.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string_view>
#include <unordered_map>

namespace flow_services {

using flow_core::Err;
using flow_core::Error;
using flow_core::ErrorCode;
using flow_core::Result;

// =============================================================================
// HttpResponse
// =============================================================================

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string percent_encode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

} // anonymous namespace

std::string HttpResponse::get_header(const std::string& name) const {
    std::string wanted = to_lower(name);
    for (const auto& [key, value] : headers) {
        if (to_lower(key) == wanted) {
            return value;
        }
    }
    return {};
}

bool HttpResponse::is_json() const {
    return to_lower(content_type()).find("json") != std::string::npos;
}

std::string build_url(const std::string& url, const std::map<std::string, std::string>& query) {
    if (query.empty()) {
        return url;
    }
    std::string out = url;
    char separator = url.find('?') == std::string::npos ? '?' : '&';
    for (const auto& [key, value] : query) {
        out += separator;
        out += percent_encode(key) + "=" + percent_encode(value);
        separator = '&';
    }
    return out;
}

// =============================================================================
// CurlHttpClient
// =============================================================================

namespace {

struct CurlHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;
using CurlList = std::unique_ptr<curl_slist, CurlListDeleter>;

/// Body and headers of the final response; a redirect's headers are discarded
/// when the next status line arrives
struct ResponseCollector {
    std::string body;
    std::string reason;
    std::unordered_map<std::string, std::string> headers;

    static size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
        static_cast<ResponseCollector*>(userdata)->body.append(ptr, size * nmemb);
        return size * nmemb;
    }

    static size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
        static_cast<ResponseCollector*>(userdata)->add_header_line(std::string_view(buffer, size * nitems));
        return size * nitems;
    }

    void add_header_line(std::string_view line) {
        while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
            line.remove_suffix(1);
        }
        if (line.empty()) {
            return;
        }

        // "HTTP/1.1 404 Not Found"
        if (line.rfind("HTTP/", 0) == 0) {
            headers.clear();
            reason.clear();
            auto first = line.find(' ');
            auto second = first == std::string_view::npos ? first : line.find(' ', first + 1);
            if (second != std::string_view::npos) {
                reason = std::string(line.substr(second + 1));
            }
            return;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return;
        }
        std::string_view value = line.substr(colon + 1);
        while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
            value.remove_prefix(1);
        }
        headers[std::string(line.substr(0, colon))] = std::string(value);
    }
};

} // anonymous namespace

/// One easy handle per request, so concurrent branches never wait on each other
class CurlHttpClient : public IHttpClient {
public:
    explicit CurlHttpClient(const flow_core::ServiceConfig& config)
        : m_config(config)
    {
        static std::once_flag global_init;
        std::call_once(global_init, []() { curl_global_init(CURL_GLOBAL_ALL); });
    }

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    Result<HttpResponse> send(const HttpRequest& request) override {
        CurlHandle curl(curl_easy_init());
        if (!curl) {
            return Err<HttpResponse>(Error(ErrorCode::ExternalFailure, "curl_easy_init failed"));
        }

        const std::string url = build_url(request.url, request.query);
        std::string method = request.method;
        std::transform(method.begin(), method.end(), method.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        apply_defaults(curl.get());
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());

        if (method == "GET") {
            curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        } else if (method == "HEAD") {
            curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        } else {
            curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        }

        CurlList header_list;
        for (const auto& [name, value] : request.headers) {
            const std::string line = name + ": " + value;
            header_list.reset(curl_slist_append(header_list.release(), line.c_str()));
        }
        if (header_list) {
            curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
        }

        ResponseCollector collector;
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &collector);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &collector);

        flow_core::service_logger()->debug("{} {}", method, url);
        const CURLcode rc = curl_easy_perform(curl.get());
        if (rc != CURLE_OK) {
            ErrorCode code = rc == CURLE_OPERATION_TIMEDOUT ? ErrorCode::Timeout : ErrorCode::ExternalFailure;
            return Err<HttpResponse>(Error(code, std::string("HTTP request failed: ") + curl_easy_strerror(rc))
                .with_context("url", url));
        }

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

        HttpResponse out;
        out.status_code = static_cast<int>(status);
        out.status_message = std::move(collector.reason);
        out.body = std::move(collector.body);
        out.headers = std::move(collector.headers);

        flow_core::service_logger()->debug("{} {} -> {} ({} bytes)", method, url, out.status_code, out.body.size());
        return out;
    }

private:
    void apply_defaults(CURL* curl) const {
        const long verify = m_config.verify_ssl ? 1L : 0L;
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify * 2L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(m_config.http_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(m_config.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, m_config.user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &ResponseCollector::on_body);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &ResponseCollector::on_header);
    }

    flow_core::ServiceConfig m_config;
};

std::shared_ptr<IHttpClient> create_curl_client(const flow_core::ServiceConfig& config) {
    return std::make_shared<CurlHttpClient>(config);
}

} // namespace flow_services
