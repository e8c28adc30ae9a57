#include <timber_mcp/core/env.hpp>

#include <cstdlib>

namespace timber_mcp {

EnvLookup ProcessEnv() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) return std::nullopt;
        return std::string(value);
    };
}

} // namespace timber_mcp
