#pragma once

/// @file value.hpp
/// @brief Runtime value type carried between nodes
///
/// Every value flowing along an edge is a JSON document. A JSON null is an
/// ordinary value; the "stop propagation" signal is modelled separately
/// by an empty std::optional at the node boundary.

#include "error.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flow_core {

using Value = nlohmann::json;

// =============================================================================
// Coercion
// =============================================================================

/// Script-style truthiness: false, 0, NaN, "" and null are falsy
[[nodiscard]] bool is_truthy(const Value& value);

/// Render a number the way a user reads it (integral doubles without ".0")
[[nodiscard]] std::string format_number(double number);

/// Strings verbatim, scalars formatted, containers serialized as compact JSON
[[nodiscard]] std::string to_display_string(const Value& value);

/// Numeric view of a value; empty when it is not a finite number
[[nodiscard]] std::optional<double> coerce_number(const Value& value);

/// Containers compare structurally, scalars compare by display string
[[nodiscard]] bool values_equal(const Value& lhs, const Value& rhs);

// =============================================================================
// Paths
// =============================================================================

/// One step of a dot path: an object key or an array index
struct PathSegment {
    std::string key;
    std::optional<std::size_t> index;

    [[nodiscard]] bool is_index() const { return index.has_value(); }
};

/// Parse "a.b[2].c" into segments. Fails on unbalanced or non-numeric brackets.
[[nodiscard]] Result<std::vector<PathSegment>> parse_path(std::string_view path);

/// Walk segments from root; nullptr when any step is missing
[[nodiscard]] const Value* resolve_path(const Value& root, const std::vector<PathSegment>& segments);

/// parse_path + resolve_path; nullptr for malformed paths too
[[nodiscard]] const Value* lookup_path(const Value& root, std::string_view path);

} // namespace flow_core
