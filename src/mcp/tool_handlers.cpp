#include <timber_mcp/mcp/tool_handlers.hpp>

#include <optional>
#include <string>

namespace timber_mcp {

namespace {

// Get a required non-empty string param. Returns nullopt and sets out_error
// on failure.
std::optional<std::string> RequireString(const nlohmann::json& params,
                                         const std::string& key,
                                         ToolResult& out_error) {
    if (!params.contains(key) || !params[key].is_string() ||
        params[key].get<std::string>().empty()) {
        out_error = MakeTextResult("Missing required parameter: " + key, true);
        return std::nullopt;
    }
    return params[key].get<std::string>();
}

} // anonymous namespace

ToolResult HandleQueryTimberKb(KnowledgeClient& client, Logger& logger,
                               const nlohmann::json& arguments) {
    ToolResult err;
    auto query = RequireString(arguments, "query", err);
    if (!query) return err;

    logger.Info("mcp", "query_timber_kb: " + *query);
    auto answer = client.Query(*query);

    auto result = MakeTextResult(std::move(answer.text));
    result.meta = {
        {"source", ProvenanceName(answer.provenance)},
        {"confidence", answer.confidence},
    };
    if (answer.retrieved_count) {
        result.meta["retrieved_count"] = *answer.retrieved_count;
    }
    return result;
}

ToolRegistry MakeToolRegistry(KnowledgeClient& client, Logger& logger) {
    ToolHandlerTable handlers;
    handlers[static_cast<size_t>(ToolId::QueryTimberKb)] =
        [&client, &logger](const nlohmann::json& arguments) {
            return HandleQueryTimberKb(client, logger, arguments);
        };
    return ToolRegistry(std::move(handlers));
}

} // namespace timber_mcp
