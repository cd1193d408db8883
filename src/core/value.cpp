/// @file value.cpp
/// @brief Value coercion and path helpers

#include <flow_engine/core/value.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace flow_core {

// =============================================================================
// Coercion
// =============================================================================

bool is_truthy(const Value& value) {
    switch (value.type()) {
        case Value::value_t::null:
        case Value::value_t::discarded:
            return false;
        case Value::value_t::boolean:
            return value.get<bool>();
        case Value::value_t::number_integer:
            return value.get<std::int64_t>() != 0;
        case Value::value_t::number_unsigned:
            return value.get<std::uint64_t>() != 0;
        case Value::value_t::number_float: {
            double d = value.get<double>();
            return d != 0.0 && !std::isnan(d);
        }
        case Value::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        default:
            return true;
    }
}

std::string format_number(double number) {
    if (std::isnan(number)) return "NaN";
    if (std::isinf(number)) return number > 0 ? "Infinity" : "-Infinity";
    if (number == std::floor(number) && std::fabs(number) < 1e15) {
        return std::to_string(static_cast<long long>(number));
    }
    return fmt::format("{}", number);
}

std::string to_display_string(const Value& value) {
    switch (value.type()) {
        case Value::value_t::string:
            return value.get<std::string>();
        case Value::value_t::number_integer:
            return std::to_string(value.get<std::int64_t>());
        case Value::value_t::number_unsigned:
            return std::to_string(value.get<std::uint64_t>());
        case Value::value_t::number_float:
            return format_number(value.get<double>());
        case Value::value_t::boolean:
            return value.get<bool>() ? "true" : "false";
        case Value::value_t::null:
            return "null";
        default:
            return value.dump();
    }
}

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

bool all_digits(std::string_view text) {
    return !text.empty() && std::all_of(text.begin(), text.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

} // anonymous namespace

std::optional<double> coerce_number(const Value& value) {
    if (value.is_number()) {
        double d = value.get<double>();
        if (!std::isfinite(d)) return std::nullopt;
        return d;
    }
    if (!value.is_string()) {
        return std::nullopt;
    }

    std::string text(trim(value.get_ref<const std::string&>()));
    if (text.empty()) {
        return std::nullopt;
    }

    char* end = nullptr;
    double d = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(d)) {
        return std::nullopt;
    }
    return d;
}

bool values_equal(const Value& lhs, const Value& rhs) {
    if (lhs.is_structured() || rhs.is_structured()) {
        return lhs == rhs;
    }
    return to_display_string(lhs) == to_display_string(rhs);
}

// =============================================================================
// Paths
// =============================================================================

Result<std::vector<PathSegment>> parse_path(std::string_view path) {
    std::vector<PathSegment> segments;
    path = trim(path);
    if (path.empty()) {
        return Ok(std::move(segments));
    }

    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t dot = path.find('.', start);
        std::string_view token = path.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
        if (token.empty()) {
            return Err<std::vector<PathSegment>>(
                Error(ErrorCode::InvalidArgument, "empty segment in path '" + std::string(path) + "'"));
        }

        std::size_t bracket = token.find('[');
        std::string_view name = token.substr(0, bracket);
        if (!name.empty()) {
            segments.push_back(PathSegment{std::string(name), std::nullopt});
        }

        while (bracket != std::string_view::npos) {
            std::size_t close = token.find(']', bracket);
            if (close == std::string_view::npos) {
                return Err<std::vector<PathSegment>>(
                    Error(ErrorCode::InvalidArgument, "unclosed '[' in path '" + std::string(path) + "'"));
            }
            std::string_view digits = token.substr(bracket + 1, close - bracket - 1);
            if (!all_digits(digits)) {
                return Err<std::vector<PathSegment>>(
                    Error(ErrorCode::InvalidArgument, "non-numeric index in path '" + std::string(path) + "'"));
            }
            segments.push_back(PathSegment{{}, static_cast<std::size_t>(std::stoull(std::string(digits)))});

            bracket = close + 1;
            if (bracket == token.size()) {
                break;
            }
            if (token[bracket] != '[') {
                return Err<std::vector<PathSegment>>(
                    Error(ErrorCode::InvalidArgument, "unexpected text after ']' in path '" + std::string(path) + "'"));
            }
        }

        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }

    return Ok(std::move(segments));
}

const Value* resolve_path(const Value& root, const std::vector<PathSegment>& segments) {
    const Value* current = &root;

    for (const auto& segment : segments) {
        if (segment.is_index()) {
            if (!current->is_array() || *segment.index >= current->size()) {
                return nullptr;
            }
            current = &(*current)[*segment.index];
            continue;
        }

        if (current->is_object()) {
            auto it = current->find(segment.key);
            if (it == current->end()) {
                return nullptr;
            }
            current = &*it;
        } else if (current->is_array() && all_digits(segment.key)) {
            std::size_t index = std::stoull(segment.key);
            if (index >= current->size()) {
                return nullptr;
            }
            current = &(*current)[index];
        } else {
            return nullptr;
        }
    }

    return current;
}

const Value* lookup_path(const Value& root, std::string_view path) {
    auto segments = parse_path(path);
    if (!segments) {
        return nullptr;
    }
    return resolve_path(root, *segments);
}

} // namespace flow_core
