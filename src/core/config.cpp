/// @file config.cpp
/// @brief engine.toml parsing

#include <flow_engine/core/config.hpp>

#include <toml++/toml.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace flow_core {

namespace {

Result<void> parse_logging(const toml::table& tbl, LogConfig& logging) {
    if (auto level = tbl["level"].value<std::string>()) {
        auto parsed = parse_log_level(*level);
        if (!parsed) {
            return Err(Error(ErrorCode::ValidationError, "Unknown log level: " + *level));
        }
        logging.level = *parsed;
    }
    if (auto console = tbl["console"].value<bool>()) {
        logging.console_enabled = *console;
    }
    if (auto file = tbl["file"].value<bool>()) {
        logging.file_enabled = *file;
    }
    if (auto dir = tbl["directory"].value<std::string>()) {
        logging.log_directory = *dir;
    }
    if (auto size = tbl["max_file_size"].value<std::int64_t>()) {
        logging.max_file_size = static_cast<std::size_t>(*size);
    }
    if (auto files = tbl["max_files"].value<std::int64_t>()) {
        logging.max_files = static_cast<std::size_t>(*files);
    }
    return Ok();
}

void parse_services(const toml::table& tbl, ServiceConfig& services) {
    if (auto url = tbl["backend_url"].value<std::string>()) {
        services.backend_url = *url;
    }
    if (auto url = tbl["ollama_url"].value<std::string>()) {
        services.ollama_url = *url;
    }
    if (auto url = tbl["openai_url"].value<std::string>()) {
        services.openai_url = *url;
    }
    if (auto key = tbl["openai_api_key"].value<std::string>()) {
        services.openai_api_key = *key;
    }
    if (auto timeout = tbl["http_timeout_ms"].value<std::int64_t>()) {
        services.http_timeout = std::chrono::milliseconds(*timeout);
    }
    if (auto timeout = tbl["connect_timeout_ms"].value<std::int64_t>()) {
        services.connect_timeout = std::chrono::milliseconds(*timeout);
    }
    if (auto verify = tbl["verify_ssl"].value<bool>()) {
        services.verify_ssl = *verify;
    }
    if (auto agent = tbl["user_agent"].value<std::string>()) {
        services.user_agent = *agent;
    }
}

} // anonymous namespace

Result<EngineConfig> parse_engine_config(const std::string& content, const std::string& source_name) {
    EngineConfig config;

    try {
        toml::table tbl = toml::parse(content, source_name);

        if (auto logging = tbl["logging"].as_table()) {
            auto result = parse_logging(*logging, config.logging);
            if (!result) {
                return Err<EngineConfig>(result.error());
            }
        }

        if (auto services = tbl["services"].as_table()) {
            parse_services(*services, config.services);
        }

        if (auto runner = tbl["runner"].as_table()) {
            if (auto trigger = (*runner)["default_trigger"].value<std::string>()) {
                config.default_trigger = *trigger;
            }
        }
    } catch (const toml::parse_error& err) {
        return Err<EngineConfig>(Error(ErrorCode::ParseError, "TOML parse error: " + std::string(err.what()))
            .with_context("source", source_name));
    }

    return config;
}

Result<EngineConfig> load_engine_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        FLOW_LOG_INFO("Engine config '{}' not found, using defaults", path.string());
        return EngineConfig{};
    }

    std::ifstream file(path);
    if (!file) {
        return Err<EngineConfig>(Error(ErrorCode::IOError, "Failed to open config: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return parse_engine_config(buffer.str(), path.string());
}

void apply_environment(EngineConfig& config, const EnvLookup& lookup) {
    if (auto level = lookup("FLOW_LOG_LEVEL")) {
        if (auto parsed = parse_log_level(*level)) {
            config.logging.level = *parsed;
        } else {
            FLOW_LOG_WARN("Ignoring FLOW_LOG_LEVEL='{}'", *level);
        }
    }
    if (auto url = lookup("FLOW_BACKEND_URL")) {
        config.services.backend_url = *url;
    }
    if (auto url = lookup("FLOW_OLLAMA_URL")) {
        config.services.ollama_url = *url;
    }
    if (auto key = lookup("OPENAI_API_KEY")) {
        config.services.openai_api_key = *key;
    }
}

EnvLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    };
}

} // namespace flow_core
