// flow_core engine configuration tests

#include <catch2/catch_test_macros.hpp>
#include <flow_engine/core/config.hpp>

#include <map>

using namespace flow_core;

TEST_CASE("Engine config defaults", "[core][config]") {
    EngineConfig config;
    REQUIRE(config.logging.level == spdlog::level::info);
    REQUIRE(config.services.backend_url == "http://localhost:8000");
    REQUIRE(config.services.ollama_url == "http://localhost:11434");
    REQUIRE(config.services.http_timeout == std::chrono::milliseconds(30000));
    REQUIRE(config.default_trigger.empty());
}

TEST_CASE("Engine config parsing", "[core][config]") {
    SECTION("all sections") {
        auto result = parse_engine_config(R"(
[logging]
level = "debug"
file = true
directory = "logs"

[services]
backend_url = "http://backend:9000"
ollama_url = "http://gpu:11434"
openai_api_key = "sk-test"
http_timeout_ms = 1500
verify_ssl = false

[runner]
default_trigger = "input-1"
)");
        REQUIRE(result);
        REQUIRE(result->logging.level == spdlog::level::debug);
        REQUIRE(result->logging.file_enabled);
        REQUIRE(result->logging.log_directory == "logs");
        REQUIRE(result->services.backend_url == "http://backend:9000");
        REQUIRE(result->services.ollama_url == "http://gpu:11434");
        REQUIRE(result->services.openai_api_key == "sk-test");
        REQUIRE(result->services.http_timeout == std::chrono::milliseconds(1500));
        REQUIRE_FALSE(result->services.verify_ssl);
        REQUIRE(result->default_trigger == "input-1");
    }

    SECTION("missing keys keep defaults") {
        auto result = parse_engine_config("[services]\nbackend_url = \"http://b\"\n");
        REQUIRE(result);
        REQUIRE(result->services.backend_url == "http://b");
        REQUIRE(result->services.ollama_url == "http://localhost:11434");
    }

    SECTION("invalid level") {
        auto result = parse_engine_config("[logging]\nlevel = \"loud\"\n");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
    }

    SECTION("malformed toml") {
        auto result = parse_engine_config("[logging\nlevel = ", "broken.toml");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == ErrorCode::ParseError);
        REQUIRE(result.error().get_context("source") != nullptr);
        REQUIRE(*result.error().get_context("source") == "broken.toml");
    }
}

TEST_CASE("Missing config file yields defaults", "[core][config]") {
    auto result = load_engine_config("/nonexistent/flow_engine/engine.toml");
    REQUIRE(result);
    REQUIRE(result->services.backend_url == "http://localhost:8000");
}

TEST_CASE("Environment overrides", "[core][config]") {
    std::map<std::string, std::string> env = {
        {"FLOW_LOG_LEVEL", "warn"},
        {"FLOW_BACKEND_URL", "http://env-backend"},
        {"OPENAI_API_KEY", "sk-env"},
    };
    EnvLookup lookup = [&env](const std::string& name) -> std::optional<std::string> {
        auto it = env.find(name);
        if (it == env.end()) return std::nullopt;
        return it->second;
    };

    EngineConfig config;
    config.services.ollama_url = "http://from-file";
    apply_environment(config, lookup);

    REQUIRE(config.logging.level == spdlog::level::warn);
    REQUIRE(config.services.backend_url == "http://env-backend");
    REQUIRE(config.services.openai_api_key == "sk-env");
    REQUIRE(config.services.ollama_url == "http://from-file");

    SECTION("invalid level is ignored") {
        env["FLOW_LOG_LEVEL"] = "loud";
        EngineConfig other;
        apply_environment(other, lookup);
        REQUIRE(other.logging.level == spdlog::level::info);
    }
}
