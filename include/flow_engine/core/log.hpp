#pragma once

/// @file log.hpp
/// @brief spdlog channels for the runner, the node lifecycle and the service clients

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#define FLOW_LOG_TRACE(...) ::flow_core::engine_logger()->trace(__VA_ARGS__)
#define FLOW_LOG_DEBUG(...) ::flow_core::engine_logger()->debug(__VA_ARGS__)
#define FLOW_LOG_INFO(...) ::flow_core::engine_logger()->info(__VA_ARGS__)
#define FLOW_LOG_WARN(...) ::flow_core::engine_logger()->warn(__VA_ARGS__)
#define FLOW_LOG_ERROR(...) ::flow_core::engine_logger()->error(__VA_ARGS__)
#define FLOW_LOG_CRITICAL(...) ::flow_core::engine_logger()->critical(__VA_ARGS__)

namespace flow_core {

// =============================================================================
// Configuration
// =============================================================================

/// [logging] section of engine.toml
struct LogConfig {
    bool console_enabled = true;     // stderr, so stdout stays free for reports
    bool file_enabled = false;
    std::string log_directory;       // flow_engine.log is written here
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Rebuild the shared sinks and replace every registered logger with one
/// writing to them. shared_ptrs obtained before the call keep their old sinks.
void configure_logging(const LogConfig& config);

// =============================================================================
// Channels
// =============================================================================

enum class LogChannel : std::uint8_t {
    Engine,    // runner, factory, CLI
    Nodes,     // node lifecycle and ExecutionContext::log lines
    Services,  // HTTP, LLM, crawler
};

[[nodiscard]] const char* channel_name(LogChannel channel);

[[nodiscard]] std::shared_ptr<spdlog::logger> channel_logger(LogChannel channel);

/// Named logger on the shared sinks, created on first use
[[nodiscard]] std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

[[nodiscard]] inline std::shared_ptr<spdlog::logger> engine_logger() { return channel_logger(LogChannel::Engine); }
[[nodiscard]] inline std::shared_ptr<spdlog::logger> node_logger() { return channel_logger(LogChannel::Nodes); }
[[nodiscard]] inline std::shared_ptr<spdlog::logger> service_logger() { return channel_logger(LogChannel::Services); }

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);
[[nodiscard]] spdlog::level::level_enum get_global_log_level();

/// Case-insensitive; accepts "warning", "err" and "fatal" as aliases
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& text);
[[nodiscard]] const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Timing
// =============================================================================

/// Logs entry and elapsed time of a run at debug level
class LogScope {
public:
    explicit LogScope(std::string label, LogChannel channel = LogChannel::Engine);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

    [[nodiscard]] std::chrono::milliseconds elapsed() const;

private:
    std::string m_label;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Flush and drop every channel; spdlog is unusable afterwards
void shutdown_logging();

} // namespace flow_core
