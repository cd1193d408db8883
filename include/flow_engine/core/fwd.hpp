#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for flow_core

namespace flow_core {

// Error handling
struct NodeError;
struct GraphError;
class Error;
template<typename T, typename E = Error> class Result;

// Configuration
struct LogConfig;
struct ServiceConfig;
struct EngineConfig;

} // namespace flow_core
