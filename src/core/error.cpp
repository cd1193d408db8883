/// @file error.cpp
/// @brief Error code mapping and formatting

#include <flow_engine/core/error.hpp>

#include <sstream>

namespace flow_core {

namespace {

ErrorCode code_for(NodeError::Kind kind) {
    switch (kind) {
        case NodeError::Kind::Configuration: return ErrorCode::ValidationError;
        case NodeError::Kind::Transform: return ErrorCode::ExternalFailure;
        case NodeError::Kind::Evaluation:
        case NodeError::Kind::Structural: return ErrorCode::InvalidArgument;
    }
    return ErrorCode::Unknown;
}

ErrorCode code_for(GraphError::Kind kind) {
    switch (kind) {
        case GraphError::Kind::Parse: return ErrorCode::ParseError;
        case GraphError::Kind::MissingField: return ErrorCode::ValidationError;
        case GraphError::Kind::DuplicateNode: return ErrorCode::AlreadyExists;
        case GraphError::Kind::UnknownNode: return ErrorCode::NotFound;
    }
    return ErrorCode::Unknown;
}

// Appends the "[Kind] message (node: id)" body for each payload alternative
struct PayloadWriter {
    std::ostringstream& out;

    void operator()(const std::string& msg) const { out << msg; }

    void operator()(const NodeError& err) const {
        out << "[NodeError:" << node_error_kind_name(err.kind) << "] " << err.message;
        append_node(err.node_id);
    }

    void operator()(const GraphError& err) const {
        out << "[GraphError] " << err.message;
        append_node(err.node_id);
    }

    void append_node(const std::string& id) const {
        if (!id.empty()) {
            out << " (node: " << id << ")";
        }
    }
};

} // anonymous namespace

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::ExternalFailure: return "ExternalFailure";
        case ErrorCode::Timeout: return "Timeout";
    }
    return "Unknown";
}

const char* node_error_kind_name(NodeError::Kind kind) {
    switch (kind) {
        case NodeError::Kind::Configuration: return "configuration";
        case NodeError::Kind::Evaluation: return "evaluation";
        case NodeError::Kind::Transform: return "transform";
        case NodeError::Kind::Structural: return "structural";
    }
    return "unknown";
}

Error::Error(NodeError err)
    : m_code(code_for(err.kind))
    , m_payload(std::move(err))
{
}

Error::Error(GraphError err)
    : m_code(code_for(err.kind))
    , m_payload(std::move(err))
{
}

std::string Error::message() const {
    if (const auto* text = std::get_if<std::string>(&m_payload)) {
        return *text;
    }
    if (const auto* node = std::get_if<NodeError>(&m_payload)) {
        return node->message;
    }
    return std::get<GraphError>(m_payload).message;
}

std::string build_error_chain(const Error& error) {
    std::ostringstream out;
    out << "[" << error_code_name(error.code()) << "] ";
    std::visit(PayloadWriter{out}, error.payload());

    for (const auto& [key, value] : error.context()) {
        out << "\n  " << key << ": " << value;
    }
    return out.str();
}

template class Result<void, Error>;
template class Result<std::string, Error>;

} // namespace flow_core
