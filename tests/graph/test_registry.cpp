// flow_graph NodeRegistry and NodeFactory tests

#include <catch2/catch_test_macros.hpp>
#include "support/test_nodes.hpp"

using namespace flow_graph;
using namespace flow_test;

TEST_CASE("NodeRegistry registration", "[graph][registry]") {
    auto recorder = std::make_shared<Recorder>();
    auto registry = make_test_registry(recorder);

    REQUIRE(registry->has_type("record"));
    REQUIRE(registry->size() == 4);
    REQUIRE(registry->types() == std::vector<std::string>{"fail", "record", "stop", "throw"});

    REQUIRE(registry->unregister_type("throw"));
    REQUIRE_FALSE(registry->unregister_type("throw"));
    REQUIRE_FALSE(registry->has_type("throw"));
}

TEST_CASE("Unknown types fall back to passthrough", "[graph][registry]") {
    NodeRegistry registry;
    NodeDescriptor descriptor{"mystery", "quantum-node", Value::object(), {}};

    auto node = registry.construct(descriptor);
    REQUIRE(node != nullptr);
    REQUIRE(node->id() == "mystery");
    REQUIRE(dynamic_cast<PassthroughNode*>(node.get()) != nullptr);

    SECTION("passthrough returns its input unchanged") {
        auto graph = make_graph(R"({"nodes": [{"id": "mystery", "type": "quantum-node"}]})");
        FlowRunner runner(std::make_shared<NodeRegistry>());

        auto report = runner.run(graph, trigger("mystery", Value{{"x", 1}}));
        REQUIRE(report);
        REQUIRE(report->statuses.at("mystery").status == NodeStatus::Success);
        REQUIRE(report->outputs.at("mystery").front() == Value{{"x", 1}});
    }
}

TEST_CASE("NodeFactory caches one instance per id", "[graph][factory]") {
    auto recorder = std::make_shared<Recorder>();
    NodeFactory factory(make_test_registry(recorder));

    auto first = factory.create("a", "record", Value::object());
    auto second = factory.create("a", "record", Value::object());
    REQUIRE(first == second);
    REQUIRE(factory.instance_count() == 1);

    auto other = factory.create("b", "stop", Value::object());
    REQUIRE(other != first);
    REQUIRE(factory.instance_count() == 2);

    SECTION("a changed type replaces the instance") {
        auto replaced = factory.create("a", "stop", Value::object());
        REQUIRE(replaced != first);
        REQUIRE(replaced->type() == "stop");
        REQUIRE(factory.find("a") == replaced);
    }

    SECTION("clear") {
        factory.clear();
        REQUIRE(factory.instance_count() == 0);
        REQUIRE(factory.find("a") == nullptr);
    }
}
