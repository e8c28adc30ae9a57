#include <catch2/catch_test_macros.hpp>

#include <timber_mcp/core/signals.hpp>
#include <timber_mcp/core/version.hpp>
#include <timber_mcp/mcp/mcp_server.hpp>
#include <timber_mcp/mcp/tool_handlers.hpp>

#include <algorithm>
#include <csignal>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace timber_mcp;

// ===========================================================================
// Helpers
// ===========================================================================

namespace {

// Server over the simulated backend with in-memory streams.
struct ServerFixture {
    Logger logger = Logger::Null();
    KnowledgeClient client{SimulatedBackend{}};
    std::istringstream in;
    std::ostringstream out;
    McpServer server{MakeToolRegistry(client, logger), logger, in, out};

    explicit ServerFixture(const std::string& input = {}) {
        in.str(input);
    }

    std::vector<nlohmann::json> OutputLines() const {
        std::vector<nlohmann::json> lines;
        std::istringstream output(out.str());
        std::string line;
        while (std::getline(output, line)) {
            lines.push_back(nlohmann::json::parse(line));
        }
        return lines;
    }
};

nlohmann::json Request(const nlohmann::json& id, const std::string& method,
                       const nlohmann::json& params = nullptr) {
    nlohmann::json msg = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
    if (!params.is_null()) {
        msg["params"] = params;
    }
    return msg;
}

// Sink that fails while logging the receipt of one method.
class FailingSink : public ILogSink {
public:
    explicit FailingSink(std::string trigger) : trigger_(std::move(trigger)) {}

    void Write(LogLevel, std::string_view, std::string_view message) override {
        if (message == trigger_) {
            throw std::runtime_error("log sink failure");
        }
    }

private:
    std::string trigger_;
};

// Installs the shutdown handlers for one test and clears the request after.
struct ShutdownScope {
    ShutdownScope() { InstallShutdownHandlers(); }
    ~ShutdownScope() { InstallShutdownHandlers(); }
};

} // anonymous namespace

// ===========================================================================
// initialize
// ===========================================================================

TEST_CASE("McpServer: initialize returns capabilities", "[mcp][server]") {
    ServerFixture fx;
    auto r = fx.server.HandleMessage(Request(1, "initialize", {
        {"protocolVersion", "2024-11-05"},
        {"clientInfo", {{"name", "test-client"}, {"version", "0.1"}}}
    }));

    CHECK(r["jsonrpc"] == "2.0");
    CHECK(r["id"] == 1);
    CHECK(r["result"]["protocolVersion"] == "2024-11-05");
    CHECK(r["result"]["capabilities"]["tools"].is_object());
    CHECK(r["result"]["serverInfo"]["name"] == "timber-mcp");
    CHECK(r["result"]["serverInfo"]["version"] == kVersion);
    CHECK(r["result"]["instructions"].is_string());
}

TEST_CASE("McpServer: initialize without params", "[mcp][server]") {
    ServerFixture fx;
    auto r = fx.server.HandleMessage(Request(1, "initialize"));
    CHECK(r["result"]["protocolVersion"] == "2024-11-05");
}

// ===========================================================================
// tools/list
// ===========================================================================

TEST_CASE("McpServer: tools/list returns query_timber_kb", "[mcp][server]") {
    ServerFixture fx;
    auto r = fx.server.HandleMessage(Request(2, "tools/list"));

    auto& tools = r["result"]["tools"];
    REQUIRE(tools.size() == 1);
    CHECK(tools[0]["name"] == "query_timber_kb");
    CHECK(tools[0]["description"] ==
          "Query the Timber knowledge base for troubleshooting information");
    CHECK(tools[0]["inputSchema"]["type"] == "object");
    CHECK(tools[0]["inputSchema"]["required"] == nlohmann::json::array({"query"}));
}

TEST_CASE("McpServer: tools/list is stable across calls", "[mcp][server]") {
    ServerFixture fx;
    auto first = fx.server.HandleMessage(Request(1, "tools/list"));
    (void)fx.server.HandleMessage(Request(2, "tools/call",
                                          {{"name", "query_timber_kb"},
                                           {"arguments", {{"query", "x"}}}}));
    auto second = fx.server.HandleMessage(Request(1, "tools/list"));
    CHECK(first.dump() == second.dump());
}

// ===========================================================================
// tools/call
// ===========================================================================

TEST_CASE("McpServer: tools/call runs the query", "[mcp][server]") {
    ServerFixture fx;
    auto r = fx.server.HandleMessage(Request(3, "tools/call", {
        {"name", "query_timber_kb"},
        {"arguments", {{"query", "ping"}}}
    }));

    CHECK(r["id"] == 3);
    CHECK(r["result"]["isError"] == false);
    REQUIRE(r["result"]["content"].size() == 1);
    CHECK(r["result"]["content"][0]["type"] == "text");
    CHECK(r["result"]["content"][0]["text"] ==
          "[LOCAL MODE] Simulated response for: ping");
    CHECK(r["result"]["_meta"]["source"] == "local_simulation");
    CHECK(r["result"]["_meta"]["confidence"] == 0.8);
}

TEST_CASE("McpServer: tools/call with missing query", "[mcp][server]") {
    ServerFixture fx;
    auto r = fx.server.HandleMessage(Request(4, "tools/call", {
        {"name", "query_timber_kb"},
        {"arguments", nlohmann::json::object()}
    }));

    CHECK_FALSE(r.contains("error"));
    CHECK(r["result"]["isError"] == true);
    CHECK(r["result"]["content"][0]["text"] == "Missing required parameter: query");
}

TEST_CASE("McpServer: tools/call with unknown tool", "[mcp][server]") {
    ServerFixture fx;
    auto r = fx.server.HandleMessage(Request(5, "tools/call", {
        {"name", "nonexistent"},
        {"arguments", nlohmann::json::object()}
    }));

    CHECK_FALSE(r.contains("error"));
    CHECK(r["result"]["isError"] == true);
    CHECK(r["result"]["content"][0]["text"] == "Unknown tool: nonexistent");
}

TEST_CASE("McpServer: tools/call without name", "[mcp][server]") {
    ServerFixture fx;
    auto r = fx.server.HandleMessage(Request(6, "tools/call", {{"arguments", {}}}));
    CHECK(r["id"] == 6);
    CHECK(r["error"]["code"] == -32602);
}

TEST_CASE("McpServer: tools/call with non-object arguments", "[mcp][server]") {
    ServerFixture fx;
    auto r = fx.server.HandleMessage(Request(7, "tools/call", {
        {"name", "query_timber_kb"},
        {"arguments", "ping"}
    }));
    CHECK(r["error"]["code"] == -32602);
}

// ===========================================================================
// Envelope validation
// ===========================================================================

TEST_CASE("McpServer: unknown method echoes id", "[mcp][server]") {
    ServerFixture fx;
    auto r = fx.server.HandleMessage(Request(99, "resources/list"));
    CHECK(r["id"] == 99);
    CHECK(r["error"]["code"] == -32601);
    CHECK(r["error"]["message"] == "Method not found: resources/list");
}

TEST_CASE("McpServer: ping is not a supported method", "[mcp][server]") {
    ServerFixture fx;
    auto r = fx.server.HandleMessage(Request("p", "ping"));
    CHECK(r["id"] == "p");
    CHECK_FALSE(r.contains("result"));
    CHECK(r["error"]["code"] == -32601);
    CHECK(r["error"]["message"] == "Method not found: ping");
}

TEST_CASE("McpServer: string and null ids are echoed", "[mcp][server]") {
    ServerFixture fx;
    CHECK(fx.server.HandleMessage(Request("abc", "tools/list"))["id"] == "abc");

    nlohmann::json notification = {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};
    auto r = fx.server.HandleMessage(notification);
    CHECK(r["id"].is_null());
    CHECK(r["error"]["code"] == -32601);
}

TEST_CASE("McpServer: non-object message is an invalid request", "[mcp][server]") {
    ServerFixture fx;
    auto r = fx.server.HandleMessage(nlohmann::json::array({1, 2}));
    CHECK(r["id"].is_null());
    CHECK(r["error"]["code"] == -32600);
}

TEST_CASE("McpServer: missing method is an invalid request", "[mcp][server]") {
    ServerFixture fx;
    auto r = fx.server.HandleMessage({{"jsonrpc", "2.0"}, {"id", 8}});
    CHECK(r["id"] == 8);
    CHECK(r["error"]["code"] == -32600);
}

TEST_CASE("McpServer: jsonrpc member is not checked", "[mcp][server]") {
    ServerFixture fx;
    auto unknown = fx.server.HandleMessage({{"jsonrpc", "1.0"}, {"id", 9}, {"method", "foo"}});
    CHECK(unknown["id"] == 9);
    CHECK(unknown["error"]["code"] == -32601);

    auto listed = fx.server.HandleMessage({{"jsonrpc", "1.0"}, {"id", 10}, {"method", "tools/list"}});
    CHECK(listed["id"] == 10);
    CHECK(listed["result"]["tools"].size() == 1);

    auto bare = fx.server.HandleMessage({{"id", 11}, {"method", "initialize"}});
    CHECK(bare["jsonrpc"] == "2.0");
    CHECK(bare.contains("result"));
}

TEST_CASE("McpServer: only tools/call rejects non-object params", "[mcp][server]") {
    ServerFixture fx;
    auto list = fx.server.HandleMessage(Request(12, "tools/list", nlohmann::json::array()));
    CHECK(list["result"]["tools"].size() == 1);

    auto init = fx.server.HandleMessage(Request(13, "initialize", "hello"));
    CHECK(init["result"]["protocolVersion"] == "2024-11-05");

    auto unknown = fx.server.HandleMessage(Request(14, "resources/list", nlohmann::json::array()));
    CHECK(unknown["error"]["code"] == -32601);

    auto call = fx.server.HandleMessage(Request(15, "tools/call", nlohmann::json::array()));
    CHECK(call["id"] == 15);
    CHECK(call["error"]["code"] == -32602);
}

// ===========================================================================
// HandleLine
// ===========================================================================

TEST_CASE("McpServer: HandleLine parse error has null id", "[mcp][server]") {
    ServerFixture fx;
    auto r = fx.server.HandleLine("{not json");
    CHECK(r["jsonrpc"] == "2.0");
    CHECK(r["id"].is_null());
    CHECK(r["error"]["code"] == -32700);
    CHECK(r["error"]["message"] == "Parse error");
}

TEST_CASE("McpServer: HandleLine turns a handler exception into an internal error",
          "[mcp][server]") {
    Logger logger(std::make_unique<FailingSink>("Received request: initialize"));
    KnowledgeClient client{SimulatedBackend{}};
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeToolRegistry(client, logger), logger, in, out);

    auto r = server.HandleLine(R"({"jsonrpc":"2.0","id":7,"method":"initialize"})");
    CHECK(r["jsonrpc"] == "2.0");
    CHECK(r["id"] == 7);
    CHECK_FALSE(r.contains("result"));
    CHECK(r["error"]["code"] == -32603);
    CHECK(r["error"]["message"] == "Internal error");
}

TEST_CASE("McpServer: Run keeps serving after an internal error", "[mcp][server]") {
    Logger logger(std::make_unique<FailingSink>("Received request: initialize"));
    KnowledgeClient client{SimulatedBackend{}};
    std::istringstream in(
        R"({"jsonrpc":"2.0","id":7,"method":"initialize"})" "\n"
        R"({"jsonrpc":"2.0","id":8,"method":"tools/list"})" "\n");
    std::ostringstream out;
    McpServer server(MakeToolRegistry(client, logger), logger, in, out);

    server.Run();

    std::istringstream output(out.str());
    std::string first;
    std::string second;
    REQUIRE(std::getline(output, first));
    REQUIRE(std::getline(output, second));
    auto fault = nlohmann::json::parse(first);
    auto listed = nlohmann::json::parse(second);
    CHECK(fault["id"] == 7);
    CHECK(fault["error"]["code"] == -32603);
    CHECK(listed["id"] == 8);
    CHECK(listed["result"]["tools"].size() == 1);
}

// ===========================================================================
// Run
// ===========================================================================

TEST_CASE("McpServer: Run answers each line in order", "[mcp][server]") {
    ServerFixture fx(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"
        "\n"
        "   \n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n"
        "oops\n"
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"query_timber_kb","arguments":{"query":"ping"}}})" "\n");

    fx.server.Run();

    auto lines = fx.OutputLines();
    REQUIRE(lines.size() == 4);
    CHECK(lines[0]["id"] == 1);
    CHECK(lines[0].contains("result"));
    CHECK(lines[1]["id"] == 2);
    CHECK(lines[2]["id"].is_null());
    CHECK(lines[2]["error"]["code"] == -32700);
    CHECK(lines[3]["id"] == 3);
    CHECK(lines[3]["result"]["content"][0]["text"] ==
          "[LOCAL MODE] Simulated response for: ping");
}

TEST_CASE("McpServer: Run on empty input writes nothing", "[mcp][server]") {
    ServerFixture fx;
    fx.server.Run();
    CHECK(fx.out.str().empty());
}

TEST_CASE("McpServer: each response is a single line", "[mcp][server]") {
    ServerFixture fx(
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"query_timber_kb","arguments":{"query":"line1\nline2"}}})" "\n");
    fx.server.Run();

    auto output = fx.out.str();
    CHECK(std::count(output.begin(), output.end(), '\n') == 1);
    auto lines = fx.OutputLines();
    REQUIRE(lines.size() == 1);
    CHECK(lines[0]["result"]["content"][0]["text"] ==
          "[LOCAL MODE] Simulated response for: line1\nline2");
}

TEST_CASE("McpServer: Run stops reading after a shutdown signal", "[mcp][server]") {
    ShutdownScope scope;

    Logger logger = Logger::Null();
    ToolHandlerTable handlers{};
    handlers[static_cast<size_t>(ToolId::QueryTimberKb)] = [](const nlohmann::json&) {
        std::raise(SIGINT);
        return MakeTextResult("stopping");
    };
    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"query_timber_kb","arguments":{"query":"x"}}})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n");
    std::ostringstream out;
    McpServer server(ToolRegistry(handlers), logger, in, out);

    server.Run();

    CHECK(ShutdownRequested());
    std::istringstream output(out.str());
    std::string line;
    std::vector<nlohmann::json> lines;
    while (std::getline(output, line)) {
        lines.push_back(nlohmann::json::parse(line));
    }
    REQUIRE(lines.size() == 1);
    CHECK(lines[0]["id"] == 1);
    CHECK(lines[0]["result"]["content"][0]["text"] == "stopping");

    // The second request is still unread.
    std::string rest;
    REQUIRE(std::getline(in, rest));
    CHECK(nlohmann::json::parse(rest)["id"] == 2);
}

TEST_CASE("McpServer: Run writes nothing once shutdown is requested", "[mcp][server]") {
    ShutdownScope scope;
    std::raise(SIGTERM);

    ServerFixture fx(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})" "\n");
    fx.server.Run();
    CHECK(fx.out.str().empty());
}
