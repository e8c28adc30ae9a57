#pragma once

#include <array>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace timber_mcp {

// ---------------------------------------------------------------------------
// ToolId: the closed set of tools this server exposes.
// Adding a tool means adding an enumerator here and a row in the tool table.
// ---------------------------------------------------------------------------
enum class ToolId {
    QueryTimberKb,
};

constexpr size_t kToolCount = 1;

[[nodiscard]] const char* ToolName(ToolId id) noexcept;

// ---------------------------------------------------------------------------
// ToolSchema: name, description and JSON Schema of a tool's input.
// ---------------------------------------------------------------------------
struct ToolSchema {
    ToolId id;
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

// ---------------------------------------------------------------------------
// ToolResult: result of executing a tool.
// `meta` is attached to the tools/call result as "_meta" when not null.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content;  // array of content blocks
    nlohmann::json meta;
};

// A tool handler takes the "arguments" object and returns a ToolResult.
using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments)>;

// One handler per ToolId, indexed by the enumerator value.
using ToolHandlerTable = std::array<ToolHandler, kToolCount>;

// A single text content block wrapped as a ToolResult.
ToolResult MakeTextResult(std::string text, bool is_error = false);

// ---------------------------------------------------------------------------
// ToolRegistry: the fixed tool table bound to handlers.
//
// Descriptors come from the static table and never change after
// construction, so Tools() is stable across calls.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    explicit ToolRegistry(ToolHandlerTable handlers);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] std::optional<ToolId> Find(std::string_view name) const;

    // Handler exceptions become error results ("Tool error: ...").
    [[nodiscard]] ToolResult Execute(ToolId id,
                                     const nlohmann::json& arguments) const;

private:
    std::vector<ToolSchema> schemas_;
    ToolHandlerTable handlers_;
};

} // namespace timber_mcp
