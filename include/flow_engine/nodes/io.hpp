#pragma once

/// @file io.hpp
/// @brief Graph entry and exit nodes: Input, Output

#include "control.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace flow_nodes {

// =============================================================================
// Input
// =============================================================================

struct InputConfig {
    enum class Mode : std::uint8_t { Batch, Foreach };

    /// Where a received value lands besides the chaining history
    enum class ChainingUpdate : std::uint8_t { Common, ReplaceCommon, Element, ReplaceElement, None };

    /// How often a received value is recorded
    enum class Accumulation : std::uint8_t { Always, OncePerContext, None };

    Mode mode = Mode::Batch;
    ChainingUpdate chaining_update = ChainingUpdate::Element;
    Accumulation accumulation = Accumulation::Always;

    std::vector<Value> chaining_items;
    std::vector<Value> common_items;
    std::vector<Value> element_items;

    /// Reads executionMode (or legacy iterateEachRow), the three item lists
    /// (legacy "items" counts as element items) and falls back to the
    /// non-empty lines of "text" / "textBuffer" when no items exist
    [[nodiscard]] static InputConfig from_json(const Value& config);

    /// {chainingItems, commonItems, elementItems}
    [[nodiscard]] Value items_json() const;

    /// common followed by element
    [[nodiscard]] std::vector<Value> combined_items() const;
};

[[nodiscard]] std::optional<InputConfig::ChainingUpdate> parse_chaining_update(const std::string& name);
[[nodiscard]] std::optional<InputConfig::Accumulation> parse_accumulation(const std::string& name);

/// Emits its item collection in batch mode, or drives its children once per
/// item through iteration contexts in foreach mode
class InputNode : public NodeBase {
public:
    InputNode(NodeDescriptor descriptor, std::shared_ptr<IConfigStore> configs = nullptr);

    [[nodiscard]] ExecuteResult execute(ExecutionContext& ctx, const Value& input) override;

    /// Configuration after local updates (used when no store is attached)
    [[nodiscard]] InputConfig effective_config() const;

private:
    void accumulate(ExecutionContext& ctx, InputConfig& config, const Value& input);

    mutable std::mutex mutex_;
    Value overlay_ = Value::object();
};

// =============================================================================
// Output
// =============================================================================

struct OutputConfig {
    enum class Format : std::uint8_t { Text, Json };

    Format format = Format::Text;

    [[nodiscard]] static OutputConfig from_json(const Value& config);
};

/// Render a value for display under the given format
[[nodiscard]] std::string format_output(const Value& value, OutputConfig::Format format);

/// Publishes a display string as its "content" and passes the input through
class OutputNode : public NodeBase {
public:
    OutputNode(NodeDescriptor descriptor, std::shared_ptr<IConfigStore> configs = nullptr);

    [[nodiscard]] ExecuteResult execute(ExecutionContext& ctx, const Value& input) override;

    [[nodiscard]] std::string last_content() const;

private:
    mutable std::mutex mutex_;
    std::string content_;
};

} // namespace flow_nodes
