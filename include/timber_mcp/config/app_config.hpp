#pragma once

#include <timber_mcp/core/log.hpp>
#include <timber_mcp/core/types.hpp>

#include <optional>
#include <string>

namespace timber_mcp {

enum class BackendMode {
    Simulated,
    Live,
};

const char* BackendModeName(BackendMode mode);

struct BackendConfig {
    BackendMode mode = BackendMode::Simulated;
    KnowledgeBaseId knowledge_base_id = KnowledgeBaseId::Create("XQHHIEJ8MA").Value();
    ModelId model_id =
        ModelId::Create("anthropic.claude-3-haiku-20240307-v1:0").Value();
    AwsRegion region = AwsRegion::Create("us-east-1").Value();
    int max_context_chars = 16000;
    int connect_timeout_seconds = 10;
    int read_timeout_seconds = 60;
};

struct LogConfig {
    std::optional<std::string> log_file = std::string("/tmp/timber_mcp_protocol.log");
    bool json = false;
    LogLevel level = LogLevel::Info;
};

struct AppConfig {
    BackendConfig backend;
    LogConfig log;
};

// ---------------------------------------------------------------------------
// ConfigOverrides: values set explicitly by one configuration source.
// Unset fields leave the lower-precedence value in place.
// ---------------------------------------------------------------------------
struct ConfigOverrides {
    std::optional<BackendMode> mode;
    std::optional<KnowledgeBaseId> knowledge_base_id;
    std::optional<ModelId> model_id;
    std::optional<AwsRegion> region;
    std::optional<int> max_context_chars;
    std::optional<int> connect_timeout_seconds;
    std::optional<int> read_timeout_seconds;
    std::optional<std::string> log_file;
    std::optional<bool> log_json;
    std::optional<LogLevel> log_level;
};

} // namespace timber_mcp
