/// @file services.cpp
/// @brief ServiceSet wiring

#include <flow_engine/services/services.hpp>

namespace flow_services {

ServiceSet make_services(const flow_core::ServiceConfig& config) {
    return make_services(config, create_curl_client(config));
}

ServiceSet make_services(const flow_core::ServiceConfig& config, std::shared_ptr<IHttpClient> http) {
    ServiceSet services;
    services.http = http;
    services.ollama = std::make_shared<OllamaClient>(http, config.ollama_url);
    services.openai = std::make_shared<OpenAiClient>(http, config.openai_url, config.openai_api_key);
    services.crawler = std::make_shared<BackendWebCrawler>(http, config.backend_url);
    services.html_parser = std::make_shared<BackendHtmlParser>(http, config.backend_url);
    return services;
}

} // namespace flow_services
