/// @file log.cpp
/// @brief Shared-sink logger registry

#include <flow_engine/core/log.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace flow_core {

namespace {

constexpr const char* kConsolePattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [tid %t] %v";

/// Every logger writes to the same sink list, so a run's engine, node and
/// service lines interleave in one file
struct LogState {
    std::mutex mutex;
    std::vector<spdlog::sink_ptr> sinks;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    spdlog::level::level_enum level = spdlog::level::info;
    bool configured = false;
};

LogState& state() {
    static LogState instance;
    return instance;
}

std::vector<spdlog::sink_ptr> build_sinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern(kConsolePattern);
        sinks.push_back(std::move(console));
    }

    if (config.file_enabled && !config.log_directory.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.log_directory, ec);
        if (ec) {
            spdlog::warn("Cannot create log directory '{}': {}", config.log_directory, ec.message());
        } else {
            auto path = std::filesystem::path(config.log_directory) / "flow_engine.log";
            try {
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    path.string(), config.max_file_size, config.max_files);
                file->set_pattern(kFilePattern);
                sinks.push_back(std::move(file));
            } catch (const spdlog::spdlog_ex& e) {
                spdlog::warn("File logging disabled: {}", e.what());
            }
        }
    }

    return sinks;
}

/// Caller holds the state lock
std::shared_ptr<spdlog::logger> find_or_create(LogState& s, const std::string& name) {
    if (auto it = s.loggers.find(name); it != s.loggers.end()) {
        return it->second;
    }

    if (!s.configured) {
        s.sinks = build_sinks(LogConfig{});
        s.configured = true;
    }

    auto logger = std::make_shared<spdlog::logger>(name, s.sinks.begin(), s.sinks.end());
    logger->set_level(s.level);
    s.loggers.emplace(name, logger);
    return logger;
}

} // anonymous namespace

void configure_logging(const LogConfig& config) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    s.sinks = build_sinks(config);
    s.level = config.level;
    s.configured = true;

    // Loggers handed out earlier may be writing on other threads, so their
    // sink lists stay untouched; the registry gets fresh instances instead
    for (auto& [name, logger] : s.loggers) {
        auto fresh = std::make_shared<spdlog::logger>(name, s.sinks.begin(), s.sinks.end());
        fresh->set_level(s.level);
        logger = std::move(fresh);
    }
    spdlog::set_level(s.level);
}

const char* channel_name(LogChannel channel) {
    switch (channel) {
        case LogChannel::Engine: return "flow_engine";
        case LogChannel::Nodes: return "flow_nodes";
        case LogChannel::Services: return "flow_services";
        default: return "flow_engine";
    }
}

std::shared_ptr<spdlog::logger> channel_logger(LogChannel channel) {
    return get_logger(channel_name(channel));
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return find_or_create(s, name);
}

void set_global_log_level(spdlog::level::level_enum level) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    s.level = level;
    for (auto& [name, logger] : s.loggers) {
        logger->set_level(level);
    }
    spdlog::set_level(level);
}

spdlog::level::level_enum get_global_log_level() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::array<std::pair<const char*, spdlog::level::level_enum>, 10> names = {{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"err", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"fatal", spdlog::level::critical},
        {"off", spdlog::level::off},
    }};
    for (const auto& [name, level] : names) {
        if (lower == name) {
            return level;
        }
    }
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// LogScope
// =============================================================================

LogScope::LogScope(std::string label, LogChannel channel)
    : m_label(std::move(label))
    , m_logger(channel_logger(channel))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->debug("begin {}", m_label);
}

LogScope::~LogScope() {
    m_logger->debug("end {} after {}ms", m_label, elapsed().count());
}

std::chrono::milliseconds LogScope::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - m_start);
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    for (auto& [name, logger] : s.loggers) {
        logger->flush();
    }
}

void shutdown_logging() {
    flush_all_loggers();

    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.loggers.clear();
    s.sinks.clear();
    s.configured = false;
    spdlog::shutdown();
}

} // namespace flow_core
