/// @file output.cpp
/// @brief OutputNode: display formatting and content publication

#include <flow_engine/nodes/io.hpp>

namespace flow_nodes {

OutputConfig OutputConfig::from_json(const Value& config) {
    OutputConfig output;
    if (config.is_object() && config.value("format", std::string("text")) == "json") {
        output.format = Format::Json;
    }
    return output;
}

std::string format_output(const Value& value, OutputConfig::Format format) {
    if (format == OutputConfig::Format::Json) {
        return value.is_string() ? value.get<std::string>() : value.dump(2);
    }
    return flow_core::to_display_string(value);
}

OutputNode::OutputNode(NodeDescriptor descriptor, std::shared_ptr<IConfigStore> configs)
    : NodeBase(std::move(descriptor), std::move(configs))
{
}

ExecuteResult OutputNode::execute(ExecutionContext& ctx, const Value& input) {
    auto config = OutputConfig::from_json(current_config());
    std::string display = format_output(input, config.format);

    if (configs_) {
        configs_->merge(id(), Value{{"content", display}});
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        content_ = display;
    }

    ctx.log("Output(" + id() + "): " + display);
    return emit(input);
}

std::string OutputNode::last_content() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return content_;
}

} // namespace flow_nodes
