#pragma once

#include <timber_mcp/core/log.hpp>
#include <timber_mcp/mcp/tool_registry.hpp>

#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

namespace timber_mcp {

constexpr const char* kProtocolVersion = "2024-11-05";
constexpr const char* kServerName = "timber-mcp";

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 server over a line-delimited stream pair.
//
// Implements JSON-RPC 2.0 with MCP methods:
//   - initialize
//   - tools/list
//   - tools/call
//
// Strictly sequential: every non-blank input line yields exactly one output
// line, written and flushed before the next line is read.
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer(ToolRegistry registry,
              Logger& logger,
              std::istream& in = std::cin,
              std::ostream& out = std::cout);

    // Run the session loop. Returns on end-of-stream or after a shutdown
    // signal; never because of a single bad request.
    void Run();

    // Decode one raw line and dispatch it. Always returns a response
    // envelope; parse failures and handler exceptions become faults.
    [[nodiscard]] nlohmann::json HandleLine(const std::string& line);

    // Dispatch one decoded message.
    [[nodiscard]] nlohmann::json HandleMessage(const nlohmann::json& message);

private:
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);

    ToolRegistry registry_;
    Logger& logger_;
    std::istream& in_;
    std::ostream& out_;
    size_t request_count_ = 0;
};

} // namespace timber_mcp
