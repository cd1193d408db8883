// flow_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <flow_engine/core/log.hpp>

#include <string>

using namespace flow_core;

TEST_CASE("Log level parsing", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("error") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE(parse_log_level("DEBUG") == spdlog::level::debug);
    REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
    REQUIRE_FALSE(parse_log_level("loud").has_value());

    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
    REQUIRE(std::string(log_level_name(spdlog::level::debug)) == "debug");
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("get_logger returns the same instance") {
        auto a = get_logger("test_logger");
        auto b = get_logger("test_logger");
        REQUIRE(a == b);
        REQUIRE(a->name() == "test_logger");
    }

    SECTION("shortcut loggers") {
        REQUIRE(engine_logger()->name() == "flow_engine");
        REQUIRE(node_logger()->name() == "flow_nodes");
        REQUIRE(service_logger()->name() == "flow_services");
    }

    SECTION("global level applies to every logger") {
        auto previous = get_global_log_level();
        set_global_log_level(spdlog::level::warn);
        REQUIRE(get_global_log_level() == spdlog::level::warn);
        REQUIRE(node_logger()->level() == spdlog::level::warn);
        set_global_log_level(previous);
    }
}

TEST_CASE("configure_logging replaces registered loggers", "[core][log]") {
    auto previous_level = get_global_log_level();
    configure_logging(LogConfig{});
    auto before = get_logger("reconfigured");
    REQUIRE(before->sinks().size() == 1);
    before->info("before reconfiguration");

    LogConfig config;
    config.console_enabled = false;
    config.level = spdlog::level::err;
    configure_logging(config);

    auto after = get_logger("reconfigured");
    REQUIRE(after != before);
    REQUIRE(after->name() == "reconfigured");
    REQUIRE(after->level() == spdlog::level::err);
    REQUIRE(after->sinks().empty());

    // The old instance is untouched and still usable
    REQUIRE(before->sinks().size() == 1);
    REQUIRE_NOTHROW(before->info("after reconfiguration"));

    LogConfig restore;
    restore.level = previous_level;
    configure_logging(restore);
    REQUIRE(get_logger("reconfigured")->sinks().size() == 1);
}

TEST_CASE("Channels map to fixed logger names", "[core][log]") {
    REQUIRE(std::string(channel_name(LogChannel::Engine)) == "flow_engine");
    REQUIRE(std::string(channel_name(LogChannel::Nodes)) == "flow_nodes");
    REQUIRE(channel_logger(LogChannel::Services) == service_logger());
}

TEST_CASE("Log scope", "[core][log]") {
    REQUIRE_NOTHROW([] {
        LogScope scope("unit");
        LogScope nodes("unit nodes", LogChannel::Nodes);
        REQUIRE(nodes.elapsed().count() >= 0);
    }());
}
