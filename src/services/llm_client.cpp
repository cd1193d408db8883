/// @file llm_client.cpp
/// @brief Ollama and OpenAI clients

#include <flow_engine/services/llm.hpp>
#include <flow_engine/core/log.hpp>
#include <flow_engine/core/value.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace flow_services {

using flow_core::Err;
using flow_core::Error;
using flow_core::ErrorCode;
using flow_core::Result;
using json = nlohmann::json;

// =============================================================================
// Helpers
// =============================================================================

std::optional<LlmProvider> parse_provider(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "ollama") return LlmProvider::Ollama;
    if (lower == "openai") return LlmProvider::OpenAi;
    return std::nullopt;
}

const char* provider_name(LlmProvider provider) {
    switch (provider) {
        case LlmProvider::Ollama: return "ollama";
        case LlmProvider::OpenAi: return "openai";
        default: return "unknown";
    }
}

std::string base64_encode(const std::string& bytes) {
    static const char* alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    std::size_t i = 0;
    while (i + 2 < bytes.size()) {
        auto b0 = static_cast<unsigned char>(bytes[i]);
        auto b1 = static_cast<unsigned char>(bytes[i + 1]);
        auto b2 = static_cast<unsigned char>(bytes[i + 2]);
        out += alphabet[b0 >> 2];
        out += alphabet[((b0 & 0x03) << 4) | (b1 >> 4)];
        out += alphabet[((b1 & 0x0F) << 2) | (b2 >> 6)];
        out += alphabet[b2 & 0x3F];
        i += 3;
    }

    std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        auto b0 = static_cast<unsigned char>(bytes[i]);
        out += alphabet[b0 >> 2];
        out += alphabet[(b0 & 0x03) << 4];
        out += "==";
    } else if (rest == 2) {
        auto b0 = static_cast<unsigned char>(bytes[i]);
        auto b1 = static_cast<unsigned char>(bytes[i + 1]);
        out += alphabet[b0 >> 2];
        out += alphabet[((b0 & 0x03) << 4) | (b1 >> 4)];
        out += alphabet[(b1 & 0x0F) << 2];
        out += '=';
    }

    return out;
}

namespace {

Result<std::string> read_image(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err<std::string>(Error(ErrorCode::IOError, "Failed to open image: " + path));
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return base64_encode(buffer.str());
}

std::string mime_type_for(const std::string& path) {
    std::string lower = path;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto ends_with = [&lower](const std::string& suffix) {
        return lower.size() >= suffix.size() && lower.compare(lower.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    if (ends_with(".png")) return "image/png";
    if (ends_with(".gif")) return "image/gif";
    if (ends_with(".bmp")) return "image/bmp";
    return "image/jpeg";
}

std::string trim_base(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

Result<json> parse_response(const HttpResponse& response, const char* provider) {
    if (!response.is_success()) {
        std::string excerpt = response.body.substr(0, 200);
        return Err<json>(Error(ErrorCode::ExternalFailure,
            std::string(provider) + " returned HTTP " + std::to_string(response.status_code) + ": " + excerpt));
    }
    try {
        return json::parse(response.body);
    } catch (const json::parse_error& e) {
        return Err<json>(Error(ErrorCode::ParseError,
            std::string(provider) + " response is not JSON: " + e.what()));
    }
}

} // anonymous namespace

// =============================================================================
// OllamaClient
// =============================================================================

OllamaClient::OllamaClient(std::shared_ptr<IHttpClient> http, std::string base_url)
    : m_http(std::move(http))
    , m_base_url(trim_base(std::move(base_url)))
{
}

Result<std::string> OllamaClient::generate(const LlmRequest& request) {
    json body = {
        {"model", request.model},
        {"prompt", request.prompt},
        {"stream", false},
        {"options", {{"temperature", request.temperature}}},
    };

    if (!request.image_paths.empty()) {
        json images = json::array();
        for (const auto& path : request.image_paths) {
            auto encoded = read_image(path);
            if (!encoded) {
                return Err<std::string>(encoded.error());
            }
            images.push_back(std::move(*encoded));
        }
        body["images"] = std::move(images);
    }

    HttpRequest http_request;
    http_request.method = "POST";
    http_request.url = m_base_url + "/api/generate";
    http_request.headers["Content-Type"] = "application/json";
    http_request.body = body.dump();

    flow_core::service_logger()->info("Ollama generate: model={} images={}", request.model, request.image_paths.size());

    auto response = m_http->send(http_request);
    if (!response) {
        return Err<std::string>(response.error());
    }

    auto parsed = parse_response(*response, "Ollama");
    if (!parsed) {
        return Err<std::string>(parsed.error());
    }

    auto it = parsed->find("response");
    if (it == parsed->end() || !it->is_string()) {
        return Err<std::string>(Error(ErrorCode::ParseError, "Ollama response has no 'response' text"));
    }
    return it->get<std::string>();
}

// =============================================================================
// OpenAiClient
// =============================================================================

OpenAiClient::OpenAiClient(std::shared_ptr<IHttpClient> http, std::string base_url, std::string api_key)
    : m_http(std::move(http))
    , m_base_url(trim_base(std::move(base_url)))
    , m_api_key(std::move(api_key))
{
}

Result<std::string> OpenAiClient::generate(const LlmRequest& request) {
    if (m_api_key.empty()) {
        return Err<std::string>(Error(ErrorCode::ValidationError, "OpenAI API key is not configured"));
    }

    json content;
    if (request.image_paths.empty()) {
        content = request.prompt;
    } else {
        content = json::array();
        content.push_back({{"type", "text"}, {"text", request.prompt}});
        for (const auto& path : request.image_paths) {
            auto encoded = read_image(path);
            if (!encoded) {
                return Err<std::string>(encoded.error());
            }
            content.push_back({
                {"type", "image_url"},
                {"image_url", {{"url", "data:" + mime_type_for(path) + ";base64," + *encoded}}},
            });
        }
    }

    json body = {
        {"model", request.model},
        {"temperature", request.temperature},
        {"messages", json::array({{{"role", "user"}, {"content", content}}})},
    };

    HttpRequest http_request;
    http_request.method = "POST";
    http_request.url = m_base_url + "/v1/chat/completions";
    http_request.headers["Content-Type"] = "application/json";
    http_request.headers["Authorization"] = "Bearer " + m_api_key;
    http_request.body = body.dump();

    flow_core::service_logger()->info("OpenAI chat completion: model={}", request.model);

    auto response = m_http->send(http_request);
    if (!response) {
        return Err<std::string>(response.error());
    }

    auto parsed = parse_response(*response, "OpenAI");
    if (!parsed) {
        return Err<std::string>(parsed.error());
    }

    const json* text = flow_core::lookup_path(*parsed, "choices[0].message.content");
    if (text == nullptr || !text->is_string()) {
        return Err<std::string>(Error(ErrorCode::ParseError, "OpenAI response has no message content"));
    }
    return text->get<std::string>();
}

} // namespace flow_services
