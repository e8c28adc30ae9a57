#include <timber_mcp/mcp/tool_registry.hpp>

#include <exception>

namespace timber_mcp {

namespace {

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

struct ToolDefinition {
    ToolId id;
    const char* description;
    nlohmann::json (*input_schema)();
};

nlohmann::json QueryTimberKbSchema() {
    return MakeSchema(
        {{"query", StringProp("The question or query about Timber")}},
        nlohmann::json::array({"query"}));
}

// Row order is the order tools/list reports.
constexpr std::array<ToolDefinition, kToolCount> kToolTable = {{
    {ToolId::QueryTimberKb,
     "Query the Timber knowledge base for troubleshooting information",
     &QueryTimberKbSchema},
}};

size_t IndexOf(ToolId id) {
    return static_cast<size_t>(id);
}

} // anonymous namespace

const char* ToolName(ToolId id) noexcept {
    switch (id) {
        case ToolId::QueryTimberKb: return "query_timber_kb";
    }
    return "";
}

ToolResult MakeTextResult(std::string text, bool is_error) {
    return ToolResult{
        is_error,
        nlohmann::json::array({{{"type", "text"}, {"text", std::move(text)}}}),
        nullptr};
}

ToolRegistry::ToolRegistry(ToolHandlerTable handlers)
    : handlers_(std::move(handlers)) {
    schemas_.reserve(kToolTable.size());
    for (const auto& row : kToolTable) {
        schemas_.push_back({row.id, ToolName(row.id), row.description,
                            row.input_schema()});
    }
}

std::optional<ToolId> ToolRegistry::Find(std::string_view name) const {
    for (const auto& schema : schemas_) {
        if (schema.name == name) {
            return schema.id;
        }
    }
    return std::nullopt;
}

ToolResult ToolRegistry::Execute(ToolId id, const nlohmann::json& arguments) const {
    const auto& handler = handlers_[IndexOf(id)];
    if (!handler) {
        return MakeTextResult(std::string("Tool not available: ") + ToolName(id), true);
    }

    try {
        return handler(arguments);
    } catch (const std::exception& e) {
        return MakeTextResult(std::string("Tool error: ") + e.what(), true);
    }
}

} // namespace timber_mcp
