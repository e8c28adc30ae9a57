#include <catch2/catch_test_macros.hpp>

#include <timber_mcp/mcp/tool_registry.hpp>

#include <stdexcept>

using namespace timber_mcp;

namespace {

ToolHandlerTable EchoHandlers() {
    ToolHandlerTable handlers;
    handlers[static_cast<size_t>(ToolId::QueryTimberKb)] =
        [](const nlohmann::json& args) {
            return MakeTextResult(args.value("query", ""));
        };
    return handlers;
}

} // anonymous namespace

TEST_CASE("ToolRegistry: lists query_timber_kb with its schema", "[mcp][registry]") {
    ToolRegistry registry(EchoHandlers());

    REQUIRE(registry.Tools().size() == 1);
    const auto& tool = registry.Tools()[0];
    CHECK(tool.id == ToolId::QueryTimberKb);
    CHECK(tool.name == "query_timber_kb");
    CHECK(tool.description ==
          "Query the Timber knowledge base for troubleshooting information");
    CHECK(tool.input_schema["type"] == "object");
    CHECK(tool.input_schema["properties"]["query"]["type"] == "string");
    CHECK(tool.input_schema["required"] == nlohmann::json::array({"query"}));
}

TEST_CASE("ToolRegistry: Find by exact name", "[mcp][registry]") {
    ToolRegistry registry(EchoHandlers());
    CHECK(registry.Find("query_timber_kb") == ToolId::QueryTimberKb);
    CHECK_FALSE(registry.Find("Query_Timber_KB").has_value());
    CHECK_FALSE(registry.Find("").has_value());
}

TEST_CASE("ToolRegistry: Execute dispatches to the handler", "[mcp][registry]") {
    ToolRegistry registry(EchoHandlers());
    auto result = registry.Execute(ToolId::QueryTimberKb, {{"query", "hello"}});
    CHECK_FALSE(result.is_error);
    REQUIRE(result.content.size() == 1);
    CHECK(result.content[0]["type"] == "text");
    CHECK(result.content[0]["text"] == "hello");
    CHECK(result.meta.is_null());
}

TEST_CASE("ToolRegistry: missing handler is an error result", "[mcp][registry]") {
    ToolRegistry registry(ToolHandlerTable{});
    auto result = registry.Execute(ToolId::QueryTimberKb, nlohmann::json::object());
    CHECK(result.is_error);
    CHECK(result.content[0]["text"] == "Tool not available: query_timber_kb");
}

TEST_CASE("ToolRegistry: handler exceptions become error results", "[mcp][registry]") {
    ToolHandlerTable handlers;
    handlers[0] = [](const nlohmann::json&) -> ToolResult {
        throw std::runtime_error("boom");
    };
    ToolRegistry registry(std::move(handlers));

    auto result = registry.Execute(ToolId::QueryTimberKb, nlohmann::json::object());
    CHECK(result.is_error);
    CHECK(result.content[0]["text"] == "Tool error: boom");
}

TEST_CASE("MakeTextResult: single text block", "[mcp][registry]") {
    auto result = MakeTextResult("oops", true);
    CHECK(result.is_error);
    CHECK(result.content == nlohmann::json::array({{{"type", "text"}, {"text", "oops"}}}));
}
