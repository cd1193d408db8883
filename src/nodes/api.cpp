/// @file api.cpp
/// @brief ApiNode: configurable HTTP request

#include <flow_engine/nodes/transform.hpp>
#include <flow_engine/core/log.hpp>

#include <algorithm>
#include <cctype>

namespace flow_nodes {

using flow_core::NodeError;

namespace {

std::map<std::string, std::string> read_string_map(const Value& config, const char* key) {
    std::map<std::string, std::string> entries;
    if (auto it = config.find(key); it != config.end() && it->is_object()) {
        for (const auto& [name, value] : it->items()) {
            if (!value.is_null()) {
                entries[name] = flow_core::to_display_string(value);
            }
        }
    }
    return entries;
}

} // anonymous namespace

ApiConfig ApiConfig::from_json(const Value& config) {
    ApiConfig api;
    if (!config.is_object()) {
        return api;
    }

    api.method = config.value("method", std::string("GET"));
    std::transform(api.method.begin(), api.method.end(), api.method.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (api.method.empty()) {
        api.method = "GET";
    }

    api.url = config.value("url", std::string());
    api.headers = read_string_map(config, "headers");
    api.query_params = read_string_map(config, "queryParams");

    if (auto body = config.find("body"); body != config.end() && !body->is_null()) {
        api.body = body->is_string() ? body->get<std::string>() : body->dump();
    }
    return api;
}

ApiNode::ApiNode(NodeDescriptor descriptor, std::shared_ptr<flow_services::IHttpClient> http,
                 std::shared_ptr<IConfigStore> configs)
    : NodeBase(std::move(descriptor), std::move(configs))
    , http_(std::move(http))
{
}

ExecuteResult ApiNode::execute(ExecutionContext& ctx, const Value& input) {
    auto config = ApiConfig::from_json(current_config());
    if (config.url.empty()) {
        return fail(NodeError::configuration(id(), "url"));
    }
    if (!http_) {
        return fail(NodeError::invalid_configuration(id(), "no HTTP client available"));
    }

    flow_services::HttpRequest request;
    request.method = config.method;
    request.url = config.url;
    request.headers = config.headers;
    request.query = config.query_params;

    if (config.body) {
        request.body = *config.body;
    } else if (config.method != "GET" && !input.is_null()) {
        request.body = input.dump();
        request.headers.emplace("Content-Type", "application/json");
    }

    ctx.log("Api(" + id() + "): " + request.method + " " + request.url);

    auto response = http_->send(request);
    if (!response) {
        return fail(NodeError::transform(id(), flow_core::build_error_chain(response.error())));
    }
    if (!response->is_success()) {
        return fail(NodeError::transform(id(),
            "HTTP " + std::to_string(response->status_code) + " from " + request.url));
    }

    Value parsed = Value::parse(response->body, nullptr, false);
    if (!parsed.is_discarded()) {
        return emit(std::move(parsed));
    }
    return emit(Value(response->body));
}

} // namespace flow_nodes
