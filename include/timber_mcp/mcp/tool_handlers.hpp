#pragma once

#include <timber_mcp/backend/knowledge_client.hpp>
#include <timber_mcp/core/log.hpp>
#include <timber_mcp/mcp/tool_registry.hpp>

namespace timber_mcp {

// query_timber_kb: requires a non-empty string "query". The answer text is
// the single content block; provenance, confidence and retrieved count go
// to "_meta".
ToolResult HandleQueryTimberKb(KnowledgeClient& client, Logger& logger,
                               const nlohmann::json& arguments);

// Bind every ToolId to its handler. The handlers capture `client` and
// `logger` by reference; both must outlive the registry.
ToolRegistry MakeToolRegistry(KnowledgeClient& client, Logger& logger);

} // namespace timber_mcp
