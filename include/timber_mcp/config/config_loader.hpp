#pragma once

#include <timber_mcp/config/app_config.hpp>
#include <timber_mcp/core/env.hpp>
#include <timber_mcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace timber_mcp {

// Options parsed from the command line.
struct CliOptions {
    std::optional<std::string> config_path;
    ConfigOverrides overrides;
};

// Parse a backend mode name: "simulated"/"local" or "live"/"bedrock".
Result<BackendMode, std::string> ParseBackendMode(std::string_view text);

// Parse a YAML config file into overrides.
Result<ConfigOverrides, Error> LoadFromYaml(std::string_view file_path);

// Read LOCAL_MODE, KNOWLEDGE_BASE_ID, MODEL_ID, AWS_REGION (or
// AWS_DEFAULT_REGION), TIMBER_MCP_LOG_FILE and TIMBER_MCP_LOG_LEVEL.
Result<ConfigOverrides, Error> LoadFromEnv(const EnvLookup& env);

// Parse CLI arguments.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Apply overrides on top of a base config.
AppConfig ApplyOverrides(AppConfig base, const ConfigOverrides& overrides);

// Validate that values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Build the effective config. Precedence, lowest to highest:
// defaults, YAML file (--config or TIMBER_MCP_CONFIG), environment, CLI.
Result<AppConfig, Error> ResolveConfig(const CliOptions& cli, const EnvLookup& env);

} // namespace timber_mcp
