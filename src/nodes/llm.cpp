/// @file llm.cpp
/// @brief LlmNode: prompt templating and provider dispatch

#include <flow_engine/nodes/transform.hpp>
#include <flow_engine/core/log.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace flow_nodes {

using flow_core::Err;
using flow_core::NodeError;
using flow_core::Result;

namespace {

constexpr std::array<const char*, 5> k_image_extensions = {".jpg", ".jpeg", ".png", ".gif", ".bmp"};

bool has_image_extension(const std::string& path) {
    std::string lower = path;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const char* ext : k_image_extensions) {
        std::string suffix(ext);
        if (lower.size() >= suffix.size() &&
            lower.compare(lower.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return true;
        }
    }
    return false;
}

std::string render_input(const Value& input) {
    if (input.is_null()) {
        return {};
    }
    if (input.is_string()) {
        return input.get<std::string>();
    }
    if (input.is_array()) {
        std::string joined;
        bool first = true;
        for (const auto& element : input) {
            if (!first) {
                joined += '\n';
            }
            first = false;
            joined += element.is_string() ? element.get<std::string>() : element.dump(2);
        }
        return joined;
    }
    if (input.is_object()) {
        return input.dump(2);
    }
    return flow_core::to_display_string(input);
}

} // anonymous namespace

Result<LlmConfig> LlmConfig::from_json(const NodeId& node_id, const Value& config) {
    LlmConfig llm;
    if (!config.is_object()) {
        return Err<LlmConfig>(NodeError::configuration(node_id, "prompt"));
    }

    std::string provider = config.value("provider", std::string("ollama"));
    auto parsed = flow_services::parse_provider(provider);
    if (!parsed) {
        return Err<LlmConfig>(NodeError::invalid_configuration(node_id, "unknown provider '" + provider + "'"));
    }
    llm.provider = *parsed;

    if (auto model = config.find("model"); model != config.end()) {
        if (!model->is_string() || model->get_ref<const std::string&>().empty()) {
            return Err<LlmConfig>(NodeError::configuration(node_id, "model"));
        }
        llm.model = model->get<std::string>();
    }

    llm.prompt = config.value("prompt", std::string());
    if (llm.prompt.empty()) {
        return Err<LlmConfig>(NodeError::configuration(node_id, "prompt"));
    }

    if (auto temperature = config.find("temperature"); temperature != config.end()) {
        if (auto number = flow_core::coerce_number(*temperature)) {
            llm.temperature = *number;
        }
    }

    if (config.value("mode", std::string("text")) == "vision") {
        llm.mode = Mode::Vision;
    }
    return llm;
}

std::string render_prompt(const std::string& prompt, const Value& input) {
    static const std::string placeholder = "{{input}}";

    std::string rendered;
    std::string replacement;
    bool rendered_input = false;

    std::size_t pos = 0;
    while (true) {
        std::size_t found = prompt.find(placeholder, pos);
        if (found == std::string::npos) {
            rendered.append(prompt, pos, std::string::npos);
            break;
        }
        if (!rendered_input) {
            replacement = render_input(input);
            rendered_input = true;
        }
        rendered.append(prompt, pos, found - pos);
        rendered += replacement;
        pos = found + placeholder.size();
    }
    return rendered;
}

std::vector<std::string> collect_image_paths(const Value& input) {
    std::vector<std::string> paths;
    auto consider = [&paths](const Value& value) {
        if (value.is_string()) {
            if (has_image_extension(value.get_ref<const std::string&>())) {
                paths.push_back(value.get<std::string>());
            }
        } else if (value.is_object()) {
            if (auto path = value.find("path"); path != value.end() && path->is_string() &&
                has_image_extension(path->get_ref<const std::string&>())) {
                paths.push_back(path->get<std::string>());
            }
        }
    };

    if (input.is_array()) {
        for (const auto& element : input) {
            consider(element);
        }
    } else {
        consider(input);
    }
    return paths;
}

LlmNode::LlmNode(NodeDescriptor descriptor, flow_services::ServiceSet services,
                 std::shared_ptr<IConfigStore> configs)
    : NodeBase(std::move(descriptor), std::move(configs))
    , services_(std::move(services))
{
}

ExecuteResult LlmNode::execute(ExecutionContext& ctx, const Value& input) {
    auto config = LlmConfig::from_json(id(), current_config());
    if (!config) {
        return fail(config.error());
    }

    flow_services::ILlmClient* client = services_.llm(config->provider);
    if (!client) {
        return fail(NodeError::invalid_configuration(id(),
            std::string("no client for provider ") + flow_services::provider_name(config->provider)));
    }

    flow_services::LlmRequest request;
    request.prompt = render_prompt(config->prompt, input);
    request.model = config->model;
    request.temperature = config->temperature;

    if (config->mode == LlmConfig::Mode::Vision) {
        request.image_paths = collect_image_paths(input);
        if (request.image_paths.empty()) {
            return fail(NodeError::invalid_configuration(id(), "vision mode requires image input"));
        }
    }

    ctx.log("Llm(" + id() + "): " + flow_services::provider_name(config->provider) + "/" + config->model +
        (request.image_paths.empty() ? "" : " with " + std::to_string(request.image_paths.size()) + " images"));

    auto response = client->generate(request);
    if (!response) {
        return fail(NodeError::transform(id(), flow_core::build_error_chain(response.error())));
    }
    return emit(Value(std::move(*response)));
}

} // namespace flow_nodes
