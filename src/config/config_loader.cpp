#include <timber_mcp/config/config_loader.hpp>

#include <timber_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>

namespace timber_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

std::string ToLower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

// Only a case-insensitive "true" keeps the simulated backend. Any other
// value, including the empty string, selects the live one.
BackendMode LocalModeFromEnv(std::string_view text) {
    return ToLower(text) == "true" ? BackendMode::Simulated : BackendMode::Live;
}

// Validate the three identifier fields and store them into overrides.
// `source` names the origin for error messages ("YAML", "environment", "CLI").
Result<void, Error> SetIdentifiers(ConfigOverrides& out,
                                   const std::string& source,
                                   const std::optional<std::string>& kb_id,
                                   const std::optional<std::string>& model_id,
                                   const std::optional<std::string>& region) {
    if (kb_id) {
        auto r = KnowledgeBaseId::Create(*kb_id);
        if (r.IsErr()) {
            return Result<void, Error>::Err(
                MakeConfigError(source + ": invalid knowledge base ID: " + r.Error()));
        }
        out.knowledge_base_id = std::move(r).Value();
    }
    if (model_id) {
        auto r = ModelId::Create(*model_id);
        if (r.IsErr()) {
            return Result<void, Error>::Err(
                MakeConfigError(source + ": invalid model ID: " + r.Error()));
        }
        out.model_id = std::move(r).Value();
    }
    if (region) {
        auto r = AwsRegion::Create(*region);
        if (r.IsErr()) {
            return Result<void, Error>::Err(
                MakeConfigError(source + ": invalid region: " + r.Error()));
        }
        out.region = std::move(r).Value();
    }
    return Result<void, Error>::Ok();
}

std::optional<std::string> OptYamlString(const YAML::Node& node, const char* key) {
    if (!node[key]) return std::nullopt;
    return node[key].as<std::string>();
}

} // anonymous namespace

const char* BackendModeName(BackendMode mode) {
    switch (mode) {
        case BackendMode::Simulated: return "simulated";
        case BackendMode::Live:      return "live";
    }
    return "simulated";
}

Result<BackendMode, std::string> ParseBackendMode(std::string_view text) {
    auto lower = ToLower(text);
    if (lower == "simulated" || lower == "local") {
        return Result<BackendMode, std::string>::Ok(BackendMode::Simulated);
    }
    if (lower == "live" || lower == "bedrock") {
        return Result<BackendMode, std::string>::Ok(BackendMode::Live);
    }
    return Result<BackendMode, std::string>::Err(
        "Unknown backend mode '" + std::string(text) +
        "' (expected simulated or live)");
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<ConfigOverrides, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<ConfigOverrides, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    ConfigOverrides overrides;
    try {
        // -- Backend --
        if (const auto backend = root["backend"]) {
            if (backend["mode"]) {
                auto mode = ParseBackendMode(backend["mode"].as<std::string>());
                if (mode.IsErr()) {
                    return Result<ConfigOverrides, Error>::Err(
                        MakeConfigError("YAML: " + mode.Error()));
                }
                overrides.mode = mode.Value();
            }
            auto ids = SetIdentifiers(overrides, "YAML",
                                      OptYamlString(backend, "knowledge_base_id"),
                                      OptYamlString(backend, "model_id"),
                                      OptYamlString(backend, "region"));
            if (ids.IsErr()) {
                return Result<ConfigOverrides, Error>::Err(ids.Error());
            }
            if (backend["max_context_chars"]) {
                overrides.max_context_chars = backend["max_context_chars"].as<int>();
            }
            if (backend["connect_timeout"]) {
                overrides.connect_timeout_seconds = backend["connect_timeout"].as<int>();
            }
            if (backend["read_timeout"]) {
                overrides.read_timeout_seconds = backend["read_timeout"].as<int>();
            }
        }

        // -- Log --
        if (const auto log = root["log"]) {
            if (log["file"]) {
                overrides.log_file = log["file"].as<std::string>();
            }
            if (log["json"]) {
                overrides.log_json = log["json"].as<bool>();
            }
            if (log["level"]) {
                auto level = ParseLogLevel(log["level"].as<std::string>());
                if (level.IsErr()) {
                    return Result<ConfigOverrides, Error>::Err(
                        MakeConfigError("YAML: " + level.Error()));
                }
                overrides.log_level = level.Value();
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<ConfigOverrides, Error>::Err(
            MakeConfigError("Invalid value in YAML file: " + std::string(e.what())));
    }

    return Result<ConfigOverrides, Error>::Ok(std::move(overrides));
}

// ---------------------------------------------------------------------------
// LoadFromEnv
// ---------------------------------------------------------------------------
Result<ConfigOverrides, Error> LoadFromEnv(const EnvLookup& env) {
    ConfigOverrides overrides;

    if (auto local_mode = env("LOCAL_MODE")) {
        overrides.mode = LocalModeFromEnv(*local_mode);
    }

    auto region = env("AWS_REGION");
    if (!region) {
        region = env("AWS_DEFAULT_REGION");
    }
    auto ids = SetIdentifiers(overrides, "environment",
                              env("KNOWLEDGE_BASE_ID"), env("MODEL_ID"), region);
    if (ids.IsErr()) {
        return Result<ConfigOverrides, Error>::Err(ids.Error());
    }

    if (auto log_file = env("TIMBER_MCP_LOG_FILE")) {
        overrides.log_file = *log_file;
    }
    if (auto log_level = env("TIMBER_MCP_LOG_LEVEL")) {
        auto level = ParseLogLevel(*log_level);
        if (level.IsErr()) {
            return Result<ConfigOverrides, Error>::Err(
                MakeConfigError("TIMBER_MCP_LOG_LEVEL: " + level.Error()));
        }
        overrides.log_level = level.Value();
    }

    return Result<ConfigOverrides, Error>::Ok(std::move(overrides));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("timber-mcp", kVersion);
    program.add_description(
        "MCP server over stdio answering Timber troubleshooting questions "
        "from a Bedrock knowledge base.");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--mode")
        .help("Backend mode: simulated or live");
    program.add_argument("--knowledge-base-id")
        .help("Bedrock knowledge base ID");
    program.add_argument("--model-id")
        .help("Bedrock model ID used for answer generation");
    program.add_argument("--region")
        .help("AWS region");
    program.add_argument("--max-context-chars")
        .help("Upper bound on the retrieved context passed to the model")
        .scan<'i', int>();
    program.add_argument("--connect-timeout")
        .help("HTTP connect timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--read-timeout")
        .help("HTTP read timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--log-file")
        .help("Log file path ('-' logs to stderr)");
    program.add_argument("--log-json")
        .help("Write log lines as JSON")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--verbose")
        .help("Same as --log-level debug")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions options;
    options.config_path = program.present("--config");

    auto& overrides = options.overrides;
    if (auto val = program.present("--mode")) {
        auto mode = ParseBackendMode(*val);
        if (mode.IsErr()) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("Invalid --mode: " + mode.Error()));
        }
        overrides.mode = mode.Value();
    }

    auto ids = SetIdentifiers(overrides, "CLI",
                              program.present("--knowledge-base-id"),
                              program.present("--model-id"),
                              program.present("--region"));
    if (ids.IsErr()) {
        return Result<CliOptions, Error>::Err(ids.Error());
    }

    overrides.max_context_chars = program.present<int>("--max-context-chars");
    overrides.connect_timeout_seconds = program.present<int>("--connect-timeout");
    overrides.read_timeout_seconds = program.present<int>("--read-timeout");
    overrides.log_file = program.present("--log-file");
    if (program.get<bool>("--log-json")) {
        overrides.log_json = true;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (level.IsErr()) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("Invalid --log-level: " + level.Error()));
        }
        overrides.log_level = level.Value();
    }
    if (program.get<bool>("--verbose")) {
        overrides.log_level = LogLevel::Debug;
    }

    return Result<CliOptions, Error>::Ok(std::move(options));
}

// ---------------------------------------------------------------------------
// ApplyOverrides
// ---------------------------------------------------------------------------
AppConfig ApplyOverrides(AppConfig base, const ConfigOverrides& overrides) {
    auto& backend = base.backend;
    if (overrides.mode) backend.mode = *overrides.mode;
    if (overrides.knowledge_base_id) backend.knowledge_base_id = *overrides.knowledge_base_id;
    if (overrides.model_id) backend.model_id = *overrides.model_id;
    if (overrides.region) backend.region = *overrides.region;
    if (overrides.max_context_chars) backend.max_context_chars = *overrides.max_context_chars;
    if (overrides.connect_timeout_seconds) {
        backend.connect_timeout_seconds = *overrides.connect_timeout_seconds;
    }
    if (overrides.read_timeout_seconds) {
        backend.read_timeout_seconds = *overrides.read_timeout_seconds;
    }

    if (overrides.log_file) {
        // "-" and "" both mean stderr.
        if (overrides.log_file->empty() || *overrides.log_file == "-") {
            base.log.log_file.reset();
        } else {
            base.log.log_file = *overrides.log_file;
        }
    }
    if (overrides.log_json) base.log.json = *overrides.log_json;
    if (overrides.log_level) base.log.level = *overrides.log_level;
    return base;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    const auto& backend = config.backend;
    if (backend.max_context_chars < 256) {
        return Result<void, Error>::Err(MakeConfigError(
            "max_context_chars must be at least 256, got " +
            std::to_string(backend.max_context_chars)));
    }
    if (backend.connect_timeout_seconds <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "connect timeout must be positive, got " +
            std::to_string(backend.connect_timeout_seconds)));
    }
    if (backend.read_timeout_seconds <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "read timeout must be positive, got " +
            std::to_string(backend.read_timeout_seconds)));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ResolveConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveConfig(const CliOptions& cli, const EnvLookup& env) {
    AppConfig config;

    auto config_path = cli.config_path;
    if (!config_path) {
        config_path = env("TIMBER_MCP_CONFIG");
    }
    if (config_path) {
        auto yaml = LoadFromYaml(*config_path);
        if (yaml.IsErr()) {
            return Result<AppConfig, Error>::Err(yaml.Error());
        }
        config = ApplyOverrides(std::move(config), yaml.Value());
    }

    auto env_overrides = LoadFromEnv(env);
    if (env_overrides.IsErr()) {
        return Result<AppConfig, Error>::Err(env_overrides.Error());
    }
    config = ApplyOverrides(std::move(config), env_overrides.Value());
    config = ApplyOverrides(std::move(config), cli.overrides);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // namespace timber_mcp
