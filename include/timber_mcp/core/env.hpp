#pragma once

#include <functional>
#include <optional>
#include <string>

namespace timber_mcp {

// Looks up an environment variable; nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// EnvLookup backed by std::getenv.
EnvLookup ProcessEnv();

} // namespace timber_mcp
