// flow_nodes MergerNode tests

#include <catch2/catch_test_macros.hpp>
#include "support/node_harness.hpp"

using namespace flow_nodes;
using namespace flow_test;

TEST_CASE("Merger config", "[nodes][merger]") {
    REQUIRE(MergerConfig::from_json(Value::object()).strategy == MergerConfig::Strategy::Array);
    REQUIRE(MergerConfig::from_json({{"strategy", "object"}}).strategy == MergerConfig::Strategy::Object);
    REQUIRE(MergerConfig::from_json({{"mergeStrategy", "object"}}).strategy == MergerConfig::Strategy::Object);

    auto config = MergerConfig::from_json({{"keys", {"name", 3, "slug"}}});
    REQUIRE(config.keys == std::vector<std::string>{"name", "slug"});
}

TEST_CASE("Merger item keys", "[nodes][merger]") {
    REQUIRE(MergerNode::item_key({{"name", "n1"}, {"id", "i1"}}, 0, {"name"}) == "n1");
    REQUIRE(MergerNode::item_key({{"id", "i1"}}, 0, {"name"}) == "i1");
    REQUIRE(MergerNode::item_key({{"id", 42}}, 0, {}) == "42");
    REQUIRE(MergerNode::item_key("plain", 3, {}) == "item_3");
}

TEST_CASE("Merger accumulates across arrivals", "[nodes][merger]") {
    NodeHarness harness;

    SECTION("array strategy grows with every arrival") {
        auto graph = single_node("m", "merger");
        auto ctx = harness.context(graph);
        auto node = ctx->factory().create(*graph->node("m"));

        auto first = node->execute(*ctx, 1);
        REQUIRE(first);
        REQUIRE(**first == Value::array({1}));

        auto second = node->execute(*ctx, 2);
        REQUIRE(**second == Value::array({1, 2}));

        auto third = node->execute(*ctx, 3);
        REQUIRE(**third == Value::array({1, 2, 3}));

        SECTION("array arrivals are flattened") {
            auto fourth = node->execute(*ctx, Value::array({4, 5}));
            REQUIRE(**fourth == Value::array({1, 2, 3, 4, 5}));
        }

        SECTION("reset clears the collection") {
            auto* merger = dynamic_cast<MergerNode*>(node.get());
            REQUIRE(merger != nullptr);
            REQUIRE(merger->items().size() == 3);
            merger->reset();
            REQUIRE(merger->items().empty());
        }
    }

    SECTION("object strategy keyed by the configured field") {
        auto graph = single_node("m", "merger", {{"strategy", "object"}, {"keys", {"id"}}});
        auto ctx = harness.context(graph);
        auto node = ctx->factory().create(*graph->node("m"));

        REQUIRE(node->execute(*ctx, Value{{"id", "x"}, {"v", 1}}));
        auto merged = node->execute(*ctx, Value{{"id", "y"}, {"v", 2}});
        REQUIRE(merged);

        Value expected = {
            {"x", {{"id", "x"}, {"v", 1}}},
            {"y", {{"id", "y"}, {"v", 2}}},
        };
        REQUIRE(**merged == expected);
    }
}

TEST_CASE("Merger fan-in within a run", "[nodes][merger]") {
    NodeHarness harness;
    auto runner = harness.runner();

    auto graph = make_graph(R"({
        "nodes": [
            {"id": "a", "type": "record", "config": {"emit": 1}},
            {"id": "b", "type": "record", "config": {"emit": 2}},
            {"id": "m", "type": "merger"},
            {"id": "sink", "type": "record"}
        ],
        "edges": [
            {"source": "a", "target": "m"},
            {"source": "b", "target": "m"},
            {"source": "m", "target": "sink"}
        ]
    })");

    auto report = runner.run(graph);
    REQUIRE(report);

    // One emission per arrival, the last one holding both values
    auto seen = harness.recorder->inputs_of("sink");
    REQUIRE(seen.size() == 2);
    const Value& last = seen[0].size() == 2 ? seen[0] : seen[1];
    REQUIRE(last.size() == 2);
    REQUIRE(report->outputs.at("m").size() == 2);
}
