#pragma once

/// @file services.hpp
/// @brief Bundle of external collaborators handed to node constructors

#include "crawler.hpp"
#include "http.hpp"
#include "llm.hpp"

#include <flow_engine/core/config.hpp>

#include <memory>

namespace flow_services {

/// Any member may be null; nodes needing a missing collaborator fail with a
/// configuration error instead of crashing
struct ServiceSet {
    std::shared_ptr<IHttpClient> http;
    std::shared_ptr<ILlmClient> ollama;
    std::shared_ptr<ILlmClient> openai;
    std::shared_ptr<IWebCrawler> crawler;
    std::shared_ptr<IHtmlParser> html_parser;

    [[nodiscard]] ILlmClient* llm(LlmProvider provider) const {
        return provider == LlmProvider::OpenAi ? openai.get() : ollama.get();
    }
};

/// Wire libcurl-backed clients from configuration
[[nodiscard]] ServiceSet make_services(const flow_core::ServiceConfig& config);

/// Same collaborators on top of an existing HTTP client
[[nodiscard]] ServiceSet make_services(const flow_core::ServiceConfig& config, std::shared_ptr<IHttpClient> http);

} // namespace flow_services
