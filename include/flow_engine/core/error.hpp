#pragma once

/// @file error.hpp
/// @brief Node and graph errors, plus the Result type every fallible call returns

#include "fwd.hpp"

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace flow_core {

// =============================================================================
// ErrorCode
// =============================================================================

enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    IOError,
    ParseError,
    ValidationError,
    ExternalFailure,  // HTTP, LLM or crawler backend
    Timeout,
};

[[nodiscard]] const char* error_code_name(ErrorCode code);

// =============================================================================
// Error Kinds
// =============================================================================

/// Failure of a single node; the run records it and carries on with other branches
struct NodeError {
    enum class Kind : std::uint8_t {
        Configuration,
        Evaluation,
        Transform,
        Structural,
    };

    Kind kind;
    std::string message;
    std::string node_id;
    std::string detail;  // field name for Configuration, reason otherwise

    [[nodiscard]] static NodeError configuration(const std::string& node_id, const std::string& field) {
        return {Kind::Configuration, "Node '" + node_id + "' is missing required configuration: " + field,
            node_id, field};
    }

    [[nodiscard]] static NodeError invalid_configuration(const std::string& node_id, const std::string& reason) {
        return {Kind::Configuration, "Node '" + node_id + "' configuration invalid: " + reason, node_id, reason};
    }

    [[nodiscard]] static NodeError evaluation(const std::string& node_id, const std::string& reason) {
        return {Kind::Evaluation, "Node '" + node_id + "' evaluation failed: " + reason, node_id, reason};
    }

    /// Message is the collaborator's reason verbatim
    [[nodiscard]] static NodeError transform(const std::string& node_id, const std::string& reason) {
        return {Kind::Transform, reason, node_id, reason};
    }

    [[nodiscard]] static NodeError structural(const std::string& node_id, const std::string& reason) {
        return {Kind::Structural, "Node '" + node_id + "' structural error: " + reason, node_id, reason};
    }
};

[[nodiscard]] const char* node_error_kind_name(NodeError::Kind kind);

/// Problems in the graph document itself; these abort the run before any node executes
struct GraphError {
    enum class Kind : std::uint8_t {
        Parse,
        MissingField,
        DuplicateNode,
        UnknownNode,
    };

    Kind kind;
    std::string message;
    std::string node_id;

    [[nodiscard]] static GraphError parse(const std::string& reason) {
        return {Kind::Parse, "Graph parse error: " + reason, {}};
    }

    [[nodiscard]] static GraphError missing_field(const std::string& field) {
        return {Kind::MissingField, "Graph document missing field: " + field, {}};
    }

    [[nodiscard]] static GraphError duplicate_node(const std::string& id) {
        return {Kind::DuplicateNode, "Duplicate node id: " + id, id};
    }

    [[nodiscard]] static GraphError unknown_node(const std::string& id) {
        return {Kind::UnknownNode, "Unknown node id: " + id, id};
    }
};

// =============================================================================
// Error
// =============================================================================

class Error {
public:
    using Payload = std::variant<std::string, NodeError, GraphError>;

    Error() : Error(ErrorCode::Unknown, "Unknown error") {}
    Error(NodeError err);
    Error(GraphError err);
    Error(const std::string& msg) : Error(ErrorCode::Unknown, msg) {}
    Error(const char* msg) : Error(ErrorCode::Unknown, std::string(msg)) {}
    Error(ErrorCode code, std::string msg) : m_code(code), m_payload(std::move(msg)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }
    [[nodiscard]] std::string message() const;

    template<typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(m_payload); }

    /// nullptr unless the error carries a T
    template<typename T>
    [[nodiscard]] const T* as() const { return std::get_if<T>(&m_payload); }

    [[nodiscard]] const Payload& payload() const noexcept { return m_payload; }

    /// Attach a key/value (url, node, path) shown by build_error_chain
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it == m_context.end() ? nullptr : &it->second;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    ErrorCode m_code;
    Payload m_payload;
    std::map<std::string, std::string> m_context;
};

/// "[Code] message" followed by one indented line per context entry
[[nodiscard]] std::string build_error_chain(const Error& error);

// =============================================================================
// Result<T, E>
// =============================================================================

template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_state(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : m_state(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_state.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return m_state.index() == 1; }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] T& value() & { return std::get<0>(m_state); }
    [[nodiscard]] const T& value() const& { return std::get<0>(m_state); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(m_state)); }

    [[nodiscard]] E& error() & { return std::get<1>(m_state); }
    [[nodiscard]] const E& error() const& { return std::get<1>(m_state); }

    [[nodiscard]] T value_or(T fallback) const {
        return is_ok() ? std::get<0>(m_state) : std::move(fallback);
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(*this).value(); }

    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    /// Value, or std::runtime_error carrying the error message
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return value();
    }

    [[nodiscard]] T&& unwrap() && {
        throw_if_err();
        return std::move(*this).value();
    }

private:
    void throw_if_err() const {
        if (is_err()) {
            throw std::runtime_error(std::get<1>(m_state).message());
        }
    }

    std::variant<T, E> m_state;
};

template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() = default;
    Result(E error) : m_error(std::move(error)), m_failed(true) {}

    [[nodiscard]] bool is_ok() const noexcept { return !m_failed; }
    [[nodiscard]] bool is_err() const noexcept { return m_failed; }
    explicit operator bool() const noexcept { return !m_failed; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    void unwrap() const {
        if (m_failed) {
            throw std::runtime_error(m_error.message());
        }
    }

private:
    E m_error;
    bool m_failed = false;
};

template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

} // namespace flow_core
