#pragma once

/// @file llm.hpp
/// @brief LLM provider clients (Ollama, OpenAI) over IHttpClient

#include "http.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace flow_services {

enum class LlmProvider : std::uint8_t {
    Ollama,
    OpenAi,
};

[[nodiscard]] std::optional<LlmProvider> parse_provider(const std::string& name);
[[nodiscard]] const char* provider_name(LlmProvider provider);

struct LlmRequest {
    std::string prompt;
    std::string model;
    double temperature = 0.7;
    std::vector<std::string> image_paths;  // Attached in vision mode
};

/// Returns the response text
class ILlmClient {
public:
    virtual ~ILlmClient() = default;

    [[nodiscard]] virtual flow_core::Result<std::string> generate(const LlmRequest& request) = 0;
};

/// POST {base_url}/api/generate
class OllamaClient : public ILlmClient {
public:
    OllamaClient(std::shared_ptr<IHttpClient> http, std::string base_url);

    [[nodiscard]] flow_core::Result<std::string> generate(const LlmRequest& request) override;

private:
    std::shared_ptr<IHttpClient> m_http;
    std::string m_base_url;
};

/// POST {base_url}/v1/chat/completions
class OpenAiClient : public ILlmClient {
public:
    OpenAiClient(std::shared_ptr<IHttpClient> http, std::string base_url, std::string api_key);

    [[nodiscard]] flow_core::Result<std::string> generate(const LlmRequest& request) override;

private:
    std::shared_ptr<IHttpClient> m_http;
    std::string m_base_url;
    std::string m_api_key;
};

/// Standard base64 (with padding)
[[nodiscard]] std::string base64_encode(const std::string& bytes);

} // namespace flow_services
