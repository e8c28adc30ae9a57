#include <timber_mcp/mcp/mcp_server.hpp>

#include <timber_mcp/core/signals.hpp>
#include <timber_mcp/core/version.hpp>
#include <timber_mcp/mcp/envelope.hpp>

#include <algorithm>
#include <cctype>
#include <exception>

namespace timber_mcp {

namespace {

bool IsBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

// Single-line serialisation. Invalid UTF-8 coming back from a backend is
// replaced rather than failing the whole response.
std::string DumpLine(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry,
                     Logger& logger,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)), logger_(logger), in_(in), out_(out) {}

void McpServer::Run() {
    logger_.Info("mcp", "Session started");

    std::string line;
    while (!ShutdownRequested() && std::getline(in_, line)) {
        if (IsBlank(line)) continue;

        auto response = HandleLine(line);
        out_ << DumpLine(response) << '\n';
        out_.flush();
    }

    if (ShutdownRequested()) {
        logger_.Info("mcp", "Server stopped by signal");
    } else {
        logger_.Info("mcp", "End of input, " + std::to_string(request_count_) +
                                " request(s) handled");
    }
}

nlohmann::json McpServer::HandleLine(const std::string& line) {
    ++request_count_;

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception& e) {
        logger_.Error("mcp", std::string("Invalid JSON received: ") + e.what());
        return MakeFault(FaultKind::ParseError, nullptr);
    }

    try {
        return HandleMessage(message);
    } catch (const std::exception& e) {
        logger_.Error("mcp", std::string("Unexpected error: ") + e.what());
        nlohmann::json id = nullptr;
        if (message.is_object() && message.contains("id")) {
            id = message["id"];
        }
        return MakeFault(FaultKind::InternalError, id);
    }
}

nlohmann::json McpServer::HandleMessage(const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeFault(FaultKind::InvalidRequest, nullptr,
                         "expected a JSON object");
    }

    // A missing id is answered with a null id.
    nlohmann::json id = message.contains("id") ? message["id"] : nlohmann::json();

    if (!message.contains("method") || !message["method"].is_string()) {
        return MakeFault(FaultKind::InvalidRequest, id, "missing method");
    }

    auto method = message["method"].get<std::string>();
    // Only tools/call inspects its params; other methods ignore them.
    auto params = message.value("params", nlohmann::json::object());
    if (params.is_null()) {
        params = nlohmann::json::object();
    }

    logger_.Info("mcp", "Received request: " + method);

    if (method == "initialize") {
        return HandleInitialize(params, id);
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        if (!params.is_object()) {
            return MakeFault(FaultKind::InvalidParams, id, "params must be an object");
        }
        return HandleToolsCall(params, id);
    }

    logger_.Warn("mcp", "Method not found: " + method);
    return MakeFault(FaultKind::MethodNotFound, id, method);
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        logger_.Info("mcp", "Client: " + params["clientInfo"].dump());
    }

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", kServerName},
        {"version", kVersion}
    };
    result["instructions"] =
        "Use query_timber_kb to ask troubleshooting questions about Timber. "
        "Answers are grounded in the Timber knowledge base.";

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return MakeFault(FaultKind::InvalidParams, id, "missing 'name' parameter");
    }

    auto tool_name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", nlohmann::json::object());
    if (arguments.is_null()) {
        arguments = nlohmann::json::object();
    }
    if (!arguments.is_object()) {
        return MakeFault(FaultKind::InvalidParams, id, "'arguments' must be an object");
    }

    auto tool = registry_.Find(tool_name);
    if (!tool) {
        logger_.Warn("mcp", "Unknown tool: " + tool_name);
        nlohmann::json unknown;
        unknown["content"] = MakeTextResult("Unknown tool: " + tool_name).content;
        unknown["isError"] = true;
        return MakeResult(id, unknown);
    }

    auto result = registry_.Execute(*tool, arguments);

    nlohmann::json response_result;
    response_result["content"] = result.content;
    response_result["isError"] = result.is_error;
    if (!result.meta.is_null()) {
        response_result["_meta"] = result.meta;
    }

    return MakeResult(id, response_result);
}

} // namespace timber_mcp
