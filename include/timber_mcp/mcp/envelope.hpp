#pragma once

#include <nlohmann/json.hpp>

#include <string_view>

namespace timber_mcp {

// ---------------------------------------------------------------------------
// FaultKind: protocol-level failures and their JSON-RPC 2.0 codes.
// ---------------------------------------------------------------------------
enum class FaultKind {
    ParseError,      // -32700
    InvalidRequest,  // -32600
    MethodNotFound,  // -32601
    InvalidParams,   // -32602
    InternalError,   // -32603
};

[[nodiscard]] int FaultCode(FaultKind kind) noexcept;

// Fixed short message for the kind, e.g. "Parse error".
[[nodiscard]] const char* FaultMessage(FaultKind kind) noexcept;

// {"jsonrpc":"2.0","id":id,"error":{"code":..,"message":..}}
// The message is FaultMessage(kind), followed by ": detail" when detail is
// non-empty.
[[nodiscard]] nlohmann::json MakeFault(FaultKind kind,
                                       const nlohmann::json& id,
                                       std::string_view detail = {});

// {"jsonrpc":"2.0","id":id,"result":result}
[[nodiscard]] nlohmann::json MakeResult(const nlohmann::json& id,
                                        const nlohmann::json& result);

} // namespace timber_mcp
