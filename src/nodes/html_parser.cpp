/// @file html_parser.cpp
/// @brief HtmlParserNode: CSS-selector extraction rules

#include <flow_engine/nodes/transform.hpp>

namespace flow_nodes {

using flow_core::Err;
using flow_core::NodeError;
using flow_core::Result;
using flow_services::ExtractionRule;
using flow_services::ExtractTarget;

Result<HtmlParserConfig> HtmlParserConfig::from_json(const NodeId& node_id, const Value& config) {
    HtmlParserConfig parser;
    if (!config.is_object()) {
        return parser;
    }

    auto rules = config.find("extractionRules");
    if (rules == config.end() || !rules->is_array()) {
        return parser;
    }

    for (std::size_t i = 0; i < rules->size(); ++i) {
        const Value& entry = (*rules)[i];
        const std::string where = "extractionRules[" + std::to_string(i) + "]";
        if (!entry.is_object()) {
            return Err<HtmlParserConfig>(NodeError::structural(node_id, where + " is not an object"));
        }

        ExtractionRule rule;
        rule.name = entry.value("name", std::string());
        rule.selector = entry.value("selector", std::string());
        if (rule.name.empty() || rule.selector.empty()) {
            return Err<HtmlParserConfig>(NodeError::structural(node_id, where + " needs a name and a selector"));
        }

        std::string target = entry.value("target", std::string("text"));
        auto parsed = flow_services::parse_extract_target(target);
        if (!parsed) {
            return Err<HtmlParserConfig>(NodeError::structural(node_id,
                where + " has unknown target '" + target + "'"));
        }
        rule.target = *parsed;

        rule.attribute = entry.value("attribute", entry.value("attribute_name", std::string()));
        if (rule.target == ExtractTarget::Attribute && rule.attribute.empty()) {
            return Err<HtmlParserConfig>(NodeError::structural(node_id, where + " needs an attribute name"));
        }
        rule.multiple = entry.value("multiple", false);
        parser.rules.push_back(std::move(rule));
    }
    return parser;
}

HtmlParserNode::HtmlParserNode(NodeDescriptor descriptor, std::shared_ptr<flow_services::IHtmlParser> parser,
                               std::shared_ptr<IConfigStore> configs)
    : NodeBase(std::move(descriptor), std::move(configs))
    , parser_(std::move(parser))
{
}

ExecuteResult HtmlParserNode::execute(ExecutionContext& ctx, const Value& input) {
    auto config = HtmlParserConfig::from_json(id(), current_config());
    if (!config) {
        return fail(config.error());
    }

    std::string html;
    if (input.is_string()) {
        html = input.get<std::string>();
    } else if (input.is_object()) {
        for (const char* key : {"html", "text"}) {
            if (auto it = input.find(key); it != input.end() && it->is_string()) {
                html = it->get<std::string>();
                break;
            }
        }
    }

    if (config->rules.empty() || html.empty()) {
        ctx.log("HtmlParser(" + id() + "): nothing to extract, passing input through");
        return emit(input);
    }
    if (!parser_) {
        return fail(NodeError::invalid_configuration(id(), "no HTML parser available"));
    }

    ctx.log("HtmlParser(" + id() + "): applying " + std::to_string(config->rules.size()) + " rules");

    auto extracted = parser_->extract(html, config->rules);
    if (!extracted) {
        return fail(NodeError::transform(id(), flow_core::build_error_chain(extracted.error())));
    }
    return emit(std::move(*extracted));
}

} // namespace flow_nodes
