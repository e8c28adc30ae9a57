#include <timber_mcp/mcp/envelope.hpp>

#include <string>

namespace timber_mcp {

int FaultCode(FaultKind kind) noexcept {
    switch (kind) {
        case FaultKind::ParseError:     return -32700;
        case FaultKind::InvalidRequest: return -32600;
        case FaultKind::MethodNotFound: return -32601;
        case FaultKind::InvalidParams:  return -32602;
        case FaultKind::InternalError:  return -32603;
    }
    return -32603;
}

const char* FaultMessage(FaultKind kind) noexcept {
    switch (kind) {
        case FaultKind::ParseError:     return "Parse error";
        case FaultKind::InvalidRequest: return "Invalid request";
        case FaultKind::MethodNotFound: return "Method not found";
        case FaultKind::InvalidParams:  return "Invalid params";
        case FaultKind::InternalError:  return "Internal error";
    }
    return "Internal error";
}

nlohmann::json MakeFault(FaultKind kind, const nlohmann::json& id,
                         std::string_view detail) {
    std::string message = FaultMessage(kind);
    if (!detail.empty()) {
        message += ": ";
        message += detail;
    }
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", FaultCode(kind)},
            {"message", message}
        }}
    };
}

nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace timber_mcp
