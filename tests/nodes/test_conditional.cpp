// flow_nodes ConditionalNode tests

#include <catch2/catch_test_macros.hpp>
#include "support/node_harness.hpp"

using namespace flow_nodes;
using namespace flow_test;
using flow_graph::NodeStatus;

TEST_CASE("Condition config shapes", "[nodes][conditional]") {
    SECTION("empty config compares against true") {
        auto condition = ConditionConfig::from_json(Value::object());
        REQUIRE(condition.type == ConditionType::EqualTo);
        REQUIRE(condition.value == true);
    }

    SECTION("flat canonical fields") {
        auto condition = ConditionConfig::from_json({{"conditionType", "numberGreaterThan"}, {"conditionValue", 5}});
        REQUIRE(condition.type == ConditionType::NumberGreaterThan);
        REQUIRE(condition.value == 5);
    }

    SECTION("nested condition object") {
        auto condition = ConditionConfig::from_json({{"condition", {{"type", "contains"}, {"value", "err"}}}});
        REQUIRE(condition.type == ConditionType::ContainsSubstring);
        REQUIRE(condition.value == "err");
    }

    SECTION("type without a value") {
        auto condition = ConditionConfig::from_json({{"conditionType", "equalTo"}});
        REQUIRE(condition.value == "");
    }

    SECTION("unknown type") {
        auto condition = ConditionConfig::from_json({{"conditionType", "regex"}, {"value", "x"}});
        REQUIRE(condition.type == ConditionType::EqualTo);
    }

    SECTION("aliases") {
        REQUIRE(parse_condition_type("greater_than") == ConditionType::NumberGreaterThan);
        REQUIRE(parse_condition_type("less_than") == ConditionType::NumberLessThan);
        REQUIRE(parse_condition_type("equal_to") == ConditionType::EqualTo);
        REQUIRE(parse_condition_type("json_path") == ConditionType::JsonPathExistsTruthy);
        REQUIRE_FALSE(parse_condition_type("between").has_value());
    }
}

TEST_CASE("Condition evaluation", "[nodes][conditional]") {
    auto make = [](ConditionType type, Value value) {
        ConditionConfig condition;
        condition.type = type;
        condition.value = std::move(value);
        return condition;
    };

    SECTION("numeric comparisons") {
        REQUIRE(evaluate_condition(make(ConditionType::NumberGreaterThan, 3), 5));
        REQUIRE(evaluate_condition(make(ConditionType::NumberGreaterThan, "3"), "5"));
        REQUIRE_FALSE(evaluate_condition(make(ConditionType::NumberGreaterThan, 5), 5));
        REQUIRE(evaluate_condition(make(ConditionType::NumberLessThan, 10), 2.5));
    }

    SECTION("non-numeric operands are false") {
        REQUIRE_FALSE(evaluate_condition(make(ConditionType::NumberGreaterThan, 3), "abc"));
        REQUIRE_FALSE(evaluate_condition(make(ConditionType::NumberLessThan, 3), Value::object()));
    }

    SECTION("equality and substring") {
        REQUIRE(evaluate_condition(make(ConditionType::EqualTo, true), true));
        REQUIRE_FALSE(evaluate_condition(make(ConditionType::EqualTo, true), false));
        REQUIRE(evaluate_condition(make(ConditionType::ContainsSubstring, "wor"), "hello world"));
        REQUIRE_FALSE(evaluate_condition(make(ConditionType::ContainsSubstring, "xyz"), "hello world"));
    }

    SECTION("json path truthiness") {
        Value input = {{"user", {{"active", true}, {"tags", Value::array()}}}};
        REQUIRE(evaluate_condition(make(ConditionType::JsonPathExistsTruthy, "user.active"), input));
        REQUIRE_FALSE(evaluate_condition(make(ConditionType::JsonPathExistsTruthy, "user.tags"), input));
        REQUIRE_FALSE(evaluate_condition(make(ConditionType::JsonPathExistsTruthy, "user.missing"), input));
        REQUIRE_FALSE(evaluate_condition(make(ConditionType::JsonPathExistsTruthy, "user..active"), input));
    }
}

TEST_CASE("Conditional branching", "[nodes][conditional]") {
    NodeHarness harness;
    auto runner = harness.runner();

    auto graph = make_graph(R"({
        "nodes": [
            {"id": "cond", "type": "conditional",
             "config": {"conditionType": "numberGreaterThan", "conditionValue": 5}},
            {"id": "big", "type": "record"},
            {"id": "small", "type": "record"},
            {"id": "plain", "type": "record"}
        ],
        "edges": [
            {"source": "cond", "target": "big", "sourceHandle": "trueHandle"},
            {"source": "cond", "target": "small", "sourceHandle": "cond-source-false"},
            {"source": "cond", "target": "plain"}
        ]
    })");

    SECTION("true path") {
        auto report = runner.run(graph, trigger("cond", 8));
        REQUIRE(report);

        REQUIRE(harness.recorder->count("big") == 1);
        REQUIRE(harness.recorder->count("small") == 0);
        REQUIRE(harness.recorder->count("plain") == 0);

        Value emitted = harness.recorder->inputs_of("big").front();
        REQUIRE(emitted["input"] == 8);
        REQUIRE(emitted["path"] == "true");
        REQUIRE(emitted["conditionResult"] == true);

        REQUIRE(report->statuses.at("small").status == NodeStatus::Skipped);
        REQUIRE(report->statuses.count("plain") == 0);
    }

    SECTION("false path through the legacy handle") {
        auto report = runner.run(graph, trigger("cond", 3));
        REQUIRE(report);
        REQUIRE(harness.recorder->count("small") == 1);
        REQUIRE(harness.recorder->count("big") == 0);
        REQUIRE(report->statuses.at("big").status == NodeStatus::Skipped);
        REQUIRE(report->statuses.at("cond").status == NodeStatus::Success);
    }

    SECTION("string input that is not a number takes the false path") {
        auto report = runner.run(graph, trigger("cond", "abc"));
        REQUIRE(report);
        REQUIRE(harness.recorder->count("small") == 1);
        REQUIRE_FALSE(report->has_errors());
    }
}
