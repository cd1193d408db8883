/// @file json_extractor.cpp
/// @brief JsonExtractorNode: path lookup with a default on miss

#include <flow_engine/nodes/transform.hpp>

namespace flow_nodes {

using flow_core::NodeError;

JsonExtractorConfig JsonExtractorConfig::from_json(const Value& config) {
    JsonExtractorConfig extractor;
    if (!config.is_object()) {
        return extractor;
    }
    extractor.path = config.value("path", std::string());
    if (auto it = config.find("defaultValue"); it != config.end()) {
        extractor.default_value = *it;
    }
    return extractor;
}

JsonExtractorNode::JsonExtractorNode(NodeDescriptor descriptor, std::shared_ptr<IConfigStore> configs)
    : NodeBase(std::move(descriptor), std::move(configs))
{
}

ExecuteResult JsonExtractorNode::execute(ExecutionContext& ctx, const Value& input) {
    auto config = JsonExtractorConfig::from_json(current_config());
    if (config.path.empty()) {
        return emit(input);
    }

    auto segments = flow_core::parse_path(config.path);
    if (!segments) {
        return fail(NodeError::structural(id(), segments.error().message()));
    }

    // Text that holds a JSON document is looked into as well
    Value source = input;
    if (input.is_string()) {
        Value parsed = Value::parse(input.get<std::string>(), nullptr, false);
        if (!parsed.is_discarded()) {
            source = std::move(parsed);
        }
    }

    const Value* found = flow_core::resolve_path(source, *segments);
    if (!found) {
        ctx.log("JsonExtractor(" + id() + "): '" + config.path + "' not found, using default");
        return emit(config.default_value);
    }
    return emit(*found);
}

} // namespace flow_nodes
