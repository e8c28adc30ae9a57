#include <timber_mcp/backend/knowledge_client.hpp>
#include <timber_mcp/config/config_loader.hpp>
#include <timber_mcp/core/log.hpp>
#include <timber_mcp/core/signals.hpp>
#include <timber_mcp/core/version.hpp>
#include <timber_mcp/mcp/mcp_server.hpp>
#include <timber_mcp/mcp/tool_handlers.hpp>

#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitStartupFailure = 1;

// Log file when configured, stderr otherwise. A log file that cannot be
// opened is reported and replaced by stderr.
std::unique_ptr<timber_mcp::ILogSink> MakeSink(const timber_mcp::LogConfig& log) {
    using namespace timber_mcp;

    if (log.log_file) {
        auto file_sink = FileSink::Open(*log.log_file, log.json);
        if (file_sink.IsOk()) {
            return std::move(file_sink).Value();
        }
        std::cerr << "timber-mcp: " << file_sink.Error().ToString()
                  << "; logging to stderr\n";
    }
    if (log.json) {
        return std::make_unique<JsonSink>(std::cerr);
    }
    return std::make_unique<ConsoleSink>(std::cerr);
}

int RunServer(const timber_mcp::AppConfig& config, timber_mcp::Logger& logger) {
    using namespace timber_mcp;

    auto client = MakeKnowledgeClient(config.backend, ProcessEnv(), logger);
    logger.Info("mcp", std::string("Starting Timber MCP Protocol Server - Mode: ") +
                           (client.Mode() == BackendMode::Live ? "BEDROCK" : "LOCAL"));

    McpServer server(MakeToolRegistry(client, logger), logger);
    server.Run();
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace timber_mcp;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        std::cerr << "timber-mcp: " << cli.Error().message << '\n';
        return cli.Error().ExitCode();
    }

    auto config = ResolveConfig(cli.Value(), ProcessEnv());
    if (config.IsErr()) {
        std::cerr << "timber-mcp: " << config.Error().message << '\n';
        return config.Error().ExitCode();
    }

    Logger logger(MakeSink(config.Value().log), config.Value().log.level);
    logger.Info("config", std::string("timber-mcp ") + kVersion +
                              ", backend mode " +
                              BackendModeName(config.Value().backend.mode));

    InstallShutdownHandlers();

    int exit_code = kExitSuccess;
    try {
        exit_code = RunServer(config.Value(), logger);
    } catch (const std::exception& e) {
        logger.Error("mcp", std::string("Server error: ") + e.what());
        exit_code = kExitStartupFailure;
    }

    logger.Flush();
    return exit_code;
}
