#pragma once

/// @file config.hpp
/// @brief Engine configuration (engine.toml + environment overrides)

#include "error.hpp"
#include "log.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace flow_core {

// =============================================================================
// Configuration Sections
// =============================================================================

/// Endpoints and transport settings for external collaborators
struct ServiceConfig {
    std::string backend_url = "http://localhost:8000";
    std::string ollama_url = "http://localhost:11434";
    std::string openai_url = "https://api.openai.com";
    std::string openai_api_key;
    std::chrono::milliseconds http_timeout{30000};
    std::chrono::milliseconds connect_timeout{10000};
    bool verify_ssl = true;
    std::string user_agent = "flow_engine/1.0";
};

/// Top-level engine configuration
struct EngineConfig {
    LogConfig logging;
    ServiceConfig services;
    std::string default_trigger;
};

// =============================================================================
// Loading
// =============================================================================

/// Environment lookup; returns nullopt for unset variables
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Parse TOML text. Missing keys keep their defaults.
[[nodiscard]] Result<EngineConfig> parse_engine_config(
    const std::string& content,
    const std::string& source_name = "engine.toml");

/// Load from file. A missing file yields defaults; a malformed one is an error.
[[nodiscard]] Result<EngineConfig> load_engine_config(const std::filesystem::path& path);

/// Apply FLOW_LOG_LEVEL, FLOW_BACKEND_URL, FLOW_OLLAMA_URL and OPENAI_API_KEY
void apply_environment(EngineConfig& config, const EnvLookup& lookup);

/// Lookup backed by the process environment
[[nodiscard]] EnvLookup process_environment();

} // namespace flow_core
