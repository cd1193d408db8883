// flow_graph FlowRunner tests

#include <catch2/catch_test_macros.hpp>
#include "support/test_nodes.hpp"

#include <mutex>

using namespace flow_graph;
using namespace flow_test;

TEST_CASE("Runner triggers", "[graph][runner]") {
    auto recorder = std::make_shared<Recorder>();
    FlowRunner runner(make_test_registry(recorder));

    auto graph = make_graph(R"({
        "nodes": [
            {"id": "r1", "type": "record"},
            {"id": "r2", "type": "record"},
            {"id": "child", "type": "record"}
        ],
        "edges": [{"source": "r1", "target": "child"}]
    })");

    SECTION("explicit trigger runs only that subtree") {
        auto report = runner.run(graph, trigger("r1", Value("in")));
        REQUIRE(report);
        REQUIRE(report->trigger == "r1");
        REQUIRE(recorder->count("r1") == 1);
        REQUIRE(recorder->count("child") == 1);
        REQUIRE(recorder->count("r2") == 0);
        REQUIRE(recorder->inputs_of("child").front() == "in");
    }

    SECTION("no trigger runs every root") {
        auto report = runner.run(graph);
        REQUIRE(report);
        REQUIRE(report->trigger.empty());
        REQUIRE(recorder->count("r1") == 1);
        REQUIRE(recorder->count("r2") == 1);
        REQUIRE(recorder->count("child") == 1);
    }

    SECTION("unknown trigger") {
        auto report = runner.run(graph, trigger("ghost"));
        REQUIRE_FALSE(report);
        REQUIRE(report.error().code() == flow_core::ErrorCode::NotFound);
    }

    SECTION("missing graph") {
        auto report = runner.run(nullptr);
        REQUIRE_FALSE(report);
        REQUIRE(report.error().code() == flow_core::ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Runs are independent", "[graph][runner]") {
    auto recorder = std::make_shared<Recorder>();
    FlowRunner runner(make_test_registry(recorder));
    auto graph = make_graph(R"({"nodes": [{"id": "a", "type": "record"}]})");

    auto first = runner.run(graph, trigger("a", Value(1)));
    auto second = runner.run(graph, trigger("a", Value(2)));

    REQUIRE(first);
    REQUIRE(second);
    REQUIRE(first->run_id != second->run_id);
    REQUIRE(second->outputs.at("a").size() == 1);
    REQUIRE(second->outputs.at("a").front() == 2);
}

TEST_CASE("Run report", "[graph][runner]") {
    auto recorder = std::make_shared<Recorder>();
    FlowRunner runner(make_test_registry(recorder));
    auto graph = make_graph(R"({
        "nodes": [{"id": "a", "type": "record"}, {"id": "b", "type": "fail"}],
        "edges": [{"source": "a", "target": "b"}]
    })");

    std::mutex mutex;
    std::vector<std::string> transitions;
    RunOptions options = trigger("a", Value("v"));
    options.listener = [&](const NodeId& id, const NodeState& state) {
        std::lock_guard<std::mutex> lock(mutex);
        transitions.push_back(id + ":" + to_string(state.status));
    };

    auto report = runner.run(graph, options);
    REQUIRE(report);

    SECTION("listener sees every transition") {
        REQUIRE(transitions == std::vector<std::string>{"a:running", "a:success", "b:running", "b:error"});
    }

    SECTION("json shape") {
        Value json = report->to_json();
        REQUIRE(json["runId"] == report->run_id);
        REQUIRE(json["trigger"] == "a");
        REQUIRE(json["statuses"]["a"]["status"] == "success");
        REQUIRE(json["statuses"]["b"]["status"] == "error");
        REQUIRE(json["statuses"]["b"]["error"] == "scripted failure");
        REQUIRE(json["outputs"]["a"] == Value::array({"v"}));
        REQUIRE(json["log"].is_array());
        REQUIRE_FALSE(json["log"].empty());
    }
}

TEST_CASE("run_group requires a group node", "[graph][runner]") {
    auto recorder = std::make_shared<Recorder>();
    FlowRunner runner(make_test_registry(recorder));
    auto graph = make_graph(R"({"nodes": [{"id": "a", "type": "record"}]})");

    auto report = runner.run_group(graph, "a");
    REQUIRE_FALSE(report);
    REQUIRE(report.error().code() == flow_core::ErrorCode::InvalidArgument);

    auto unknown = runner.run_group(graph, "ghost");
    REQUIRE_FALSE(unknown);
    REQUIRE(unknown.error().code() == flow_core::ErrorCode::NotFound);
}
