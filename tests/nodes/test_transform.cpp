// flow_nodes transform node tests: extractor, API, LLM, crawler, HTML parser

#include <catch2/catch_test_macros.hpp>
#include "support/node_harness.hpp"

#include <limits>

using namespace flow_nodes;
using namespace flow_test;
using flow_core::ErrorCode;
using flow_graph::NodeStatus;

namespace {

/// Execute a lone node of the given type once against input
ExecuteResult run_once(NodeHarness& harness, const std::string& type, const Value& config, const Value& input) {
    auto graph = single_node("n", type, config);
    auto ctx = harness.context(graph);
    auto node = ctx->factory().create(*graph->node("n"));
    return node->execute(*ctx, input);
}

} // anonymous namespace

// =============================================================================
// JSON Extractor
// =============================================================================

TEST_CASE("JsonExtractor", "[nodes][transform]") {
    NodeHarness harness;
    Value document = {{"user", {{"name", "Ada"}, {"roles", {"admin", "dev"}}}}};

    SECTION("nested path") {
        auto result = run_once(harness, "json-extractor", {{"path", "user.roles[1]"}}, document);
        REQUIRE(result);
        REQUIRE(**result == "dev");
    }

    SECTION("string input holding JSON") {
        auto result = run_once(harness, "json-extractor", {{"path", "user.name"}}, document.dump());
        REQUIRE(result);
        REQUIRE(**result == "Ada");
    }

    SECTION("miss yields the default") {
        auto result = run_once(harness, "json-extractor",
            {{"path", "user.email"}, {"defaultValue", "n/a"}}, document);
        REQUIRE(result);
        REQUIRE(**result == "n/a");
    }

    SECTION("miss without a default yields null") {
        auto result = run_once(harness, "json-extractor", {{"path", "user.email"}}, document);
        REQUIRE(result);
        REQUIRE((*result)->is_null());
    }

    SECTION("empty path passes the input through") {
        auto result = run_once(harness, "json-extractor", Value::object(), document);
        REQUIRE(result);
        REQUIRE(**result == document);
    }

    SECTION("malformed path") {
        auto result = run_once(harness, "json-extractor", {{"path", "user..name"}}, document);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
    }
}

// =============================================================================
// API
// =============================================================================

TEST_CASE("ApiNode", "[nodes][transform]") {
    NodeHarness harness;

    SECTION("GET with query and headers") {
        harness.http = FakeHttpClient::replying(200, R"({"items": [1, 2]})");
        auto result = run_once(harness, "api", {
            {"url", "https://api.example.com/items"},
            {"headers", {{"X-Token", "abc"}}},
            {"queryParams", {{"page", 2}}},
        }, "ignored");

        REQUIRE(result);
        REQUIRE(**result == Value{{"items", {1, 2}}});

        auto sent = harness.http->requests().front();
        REQUIRE(sent.method == "GET");
        REQUIRE(sent.url == "https://api.example.com/items");
        REQUIRE(sent.headers.at("X-Token") == "abc");
        REQUIRE(sent.query.at("page") == "2");
        REQUIRE(sent.body.empty());
    }

    SECTION("POST sends the input as JSON") {
        harness.http = FakeHttpClient::replying(201, "created", "text/plain");
        auto result = run_once(harness, "api",
            {{"url", "https://api.example.com/items"}, {"method", "post"}}, Value{{"name", "widget"}});

        REQUIRE(result);
        REQUIRE(**result == "created");

        auto sent = harness.http->requests().front();
        REQUIRE(sent.method == "POST");
        REQUIRE(Value::parse(sent.body) == Value{{"name", "widget"}});
        REQUIRE(sent.headers.at("Content-Type") == "application/json");
    }

    SECTION("configured body wins over the input") {
        harness.http = FakeHttpClient::replying(200, "{}");
        auto result = run_once(harness, "api",
            {{"url", "https://x"}, {"method", "PUT"}, {"body", {{"fixed", true}}}}, "input");
        REQUIRE(result);
        REQUIRE(Value::parse(harness.http->requests().front().body) == Value{{"fixed", true}});
    }

    SECTION("missing url") {
        auto result = run_once(harness, "api", Value::object(), nullptr);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
        REQUIRE(harness.http->requests().empty());
    }

    SECTION("non-2xx status") {
        harness.http = FakeHttpClient::replying(503, "down", "text/plain");
        auto result = run_once(harness, "api", {{"url", "https://x/status"}}, nullptr);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == ErrorCode::ExternalFailure);
        REQUIRE(result.error().message() == "HTTP 503 from https://x/status");
    }

    SECTION("transport failure") {
        harness.http = std::make_shared<FakeHttpClient>([](const flow_services::HttpRequest&) {
            return flow_core::Err<flow_services::HttpResponse>(
                flow_core::Error(ErrorCode::Timeout, "connection timed out"));
        });
        auto result = run_once(harness, "api", {{"url", "https://x"}}, nullptr);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == ErrorCode::ExternalFailure);
        REQUIRE(result.error().message().find("connection timed out") != std::string::npos);
    }
}

// =============================================================================
// LLM
// =============================================================================

TEST_CASE("Prompt rendering", "[nodes][transform]") {
    REQUIRE(render_prompt("Summarize: {{input}}", "text") == "Summarize: text");
    REQUIRE(render_prompt("{{input}} and {{input}}", "x") == "x and x");
    REQUIRE(render_prompt("Lines:\n{{input}}", Value::array({"a", "b"})) == "Lines:\na\nb");
    REQUIRE(render_prompt("Data: {{input}}", Value{{"k", 1}}) == "Data: {\n  \"k\": 1\n}");
    REQUIRE(render_prompt("Nothing: [{{input}}]", nullptr) == "Nothing: []");
    REQUIRE(render_prompt("No placeholder", "ignored") == "No placeholder");
}

TEST_CASE("Image path collection", "[nodes][transform]") {
    REQUIRE(collect_image_paths("/tmp/cat.JPG") == std::vector<std::string>{"/tmp/cat.JPG"});
    REQUIRE(collect_image_paths("/tmp/notes.txt").empty());

    Value mixed = Value::array({"a.png", Value{{"path", "b.gif"}}, "c.pdf", 7, Value{{"path", "d.bmp"}}});
    REQUIRE(collect_image_paths(mixed) == std::vector<std::string>{"a.png", "b.gif", "d.bmp"});
}

TEST_CASE("LlmNode", "[nodes][transform]") {
    NodeHarness harness;

    SECTION("renders the prompt and emits the reply") {
        auto result = run_once(harness, "llm",
            {{"prompt", "Translate: {{input}}"}, {"model", "mistral"}, {"temperature", "0.1"}}, "bonjour");
        REQUIRE(result);
        REQUIRE(**result == "generated text");

        auto request = harness.llm->requests().front();
        REQUIRE(request.prompt == "Translate: bonjour");
        REQUIRE(request.model == "mistral");
        REQUIRE(request.temperature == 0.1);
        REQUIRE(request.image_paths.empty());
    }

    SECTION("default model") {
        REQUIRE(run_once(harness, "llm", {{"prompt", "hi"}}, nullptr));
        REQUIRE(harness.llm->requests().front().model == "llama3");
    }

    SECTION("missing prompt") {
        auto result = run_once(harness, "llm", {{"model", "llama3"}}, "x");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
    }

    SECTION("empty model") {
        auto result = run_once(harness, "llm", {{"prompt", "hi"}, {"model", ""}}, "x");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
    }

    SECTION("unknown provider") {
        auto result = run_once(harness, "llm", {{"prompt", "hi"}, {"provider", "mystery"}}, "x");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
        REQUIRE(harness.llm->requests().empty());
    }

    SECTION("vision mode collects images") {
        auto result = run_once(harness, "llm", {{"prompt", "Describe"}, {"mode", "vision"}},
            Value::array({"/img/one.png", "/img/two.jpeg"}));
        REQUIRE(result);
        REQUIRE(harness.llm->requests().front().image_paths ==
                std::vector<std::string>{"/img/one.png", "/img/two.jpeg"});
    }

    SECTION("vision mode without images") {
        auto result = run_once(harness, "llm", {{"prompt", "Describe"}, {"mode", "vision"}}, "no images here");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
    }

    SECTION("client failure") {
        harness.llm->set_failing(true);
        auto result = run_once(harness, "llm", {{"prompt", "hi"}}, "x");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == ErrorCode::ExternalFailure);
        REQUIRE(result.error().message().find("model unavailable") != std::string::npos);
    }
}

// =============================================================================
// Web Crawler
// =============================================================================

TEST_CASE("WebCrawlerNode", "[nodes][transform]") {
    NodeHarness harness;

    SECTION("full output") {
        auto result = run_once(harness, "web-crawler", {
            {"url", "https://example.com"},
            {"waitForSelector", "#content"},
            {"timeout", "2500"},
            {"extractSelectors", Value::array({Value{{"name", "heading"}, {"selector", "h1"}}})},
        }, nullptr);
        REQUIRE(result);

        const Value& page = **result;
        REQUIRE(page["url"] == "https://example.com");
        REQUIRE(page["title"] == "Example");
        REQUIRE(page["text"] == "Hi");
        REQUIRE(page["extracted"]["heading"] == "Hi");

        const auto& request = harness.crawler->last_request;
        REQUIRE(request.wait_for_selector == "#content");
        REQUIRE(request.timeout_ms == 2500);
        REQUIRE(request.extract_selectors.at("heading") == "h1");
    }

    SECTION("oversized timeout is clamped") {
        auto config = WebCrawlerConfig::from_json({{"url", "https://example.com"}, {"timeout", 1e12}});
        REQUIRE(config.timeout_ms == std::numeric_limits<int>::max());

        auto negative = WebCrawlerConfig::from_json({{"url", "https://example.com"}, {"timeout", -5}});
        REQUIRE(negative.timeout_ms == WebCrawlerConfig{}.timeout_ms);
    }

    SECTION("url taken from the input") {
        auto result = run_once(harness, "web-crawler", {{"outputFormat", "html"}}, "https://input.example");
        REQUIRE(result);
        REQUIRE(**result == "<html><body><h1>Hi</h1></body></html>");
        REQUIRE(harness.crawler->last_request.url == "https://input.example");
    }

    SECTION("extracted output") {
        auto result = run_once(harness, "web-crawler",
            {{"url", "https://example.com"}, {"outputFormat", "extracted"}}, nullptr);
        REQUIRE(result);
        REQUIRE(**result == Value{{"heading", "Hi"}});
    }

    SECTION("missing url") {
        auto result = run_once(harness, "web-crawler", Value::object(), "not a url");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
    }

    SECTION("crawl failure") {
        harness.crawler->fail = true;
        auto result = run_once(harness, "web-crawler", {{"url", "https://slow.example"}}, nullptr);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == ErrorCode::ExternalFailure);
    }
}

// =============================================================================
// HTML Parser
// =============================================================================

TEST_CASE("HtmlParser rules", "[nodes][transform]") {
    SECTION("valid rules") {
        auto config = HtmlParserConfig::from_json("p", {{"extractionRules", {
            {{"name", "title"}, {"selector", "h1"}},
            {{"name", "links"}, {"selector", "a"}, {"target", "attribute"}, {"attribute_name", "href"},
             {"multiple", true}},
        }}});
        REQUIRE(config);
        REQUIRE(config->rules.size() == 2);
        REQUIRE(config->rules[0].target == flow_services::ExtractTarget::Text);
        REQUIRE(config->rules[1].attribute == "href");
        REQUIRE(config->rules[1].multiple);
    }

    SECTION("rule without a selector") {
        auto config = HtmlParserConfig::from_json("p", {{"extractionRules", {{{"name", "title"}}}}});
        REQUIRE_FALSE(config);
        REQUIRE(config.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("attribute target without an attribute") {
        auto config = HtmlParserConfig::from_json("p", {{"extractionRules", {
            {{"name", "img"}, {"selector", "img"}, {"target", "attribute"}},
        }}});
        REQUIRE_FALSE(config);
    }

    SECTION("unknown target") {
        auto config = HtmlParserConfig::from_json("p", {{"extractionRules", {
            {{"name", "x"}, {"selector", "p"}, {"target", "style"}},
        }}});
        REQUIRE_FALSE(config);
    }
}

TEST_CASE("HtmlParserNode", "[nodes][transform]") {
    NodeHarness harness;
    Value config = {{"extractionRules", {{{"name", "title"}, {"selector", "h1"}}}}};

    SECTION("html from a string input") {
        auto result = run_once(harness, "html-parser", config, "<h1>Hello</h1>");
        REQUIRE(result);
        REQUIRE(**result == Value{{"title", "h1"}});
        REQUIRE(harness.parser->last_html == "<h1>Hello</h1>");
    }

    SECTION("html from a crawled page") {
        auto result = run_once(harness, "html-parser", config, Value{{"url", "u"}, {"html", "<p>x</p>"}});
        REQUIRE(result);
        REQUIRE(harness.parser->last_html == "<p>x</p>");
    }

    SECTION("no html passes the input through") {
        auto result = run_once(harness, "html-parser", config, 17);
        REQUIRE(result);
        REQUIRE(**result == 17);
        REQUIRE(harness.parser->last_rules.empty());
    }

    SECTION("invalid rules fail the node") {
        auto graph = single_node("p", "html-parser", {{"extractionRules", {"oops"}}});
        auto runner = harness.runner();
        auto report = runner.run(graph, trigger("p", "<p></p>"));
        REQUIRE(report);
        REQUIRE(report->statuses.at("p").status == NodeStatus::Error);
    }
}
