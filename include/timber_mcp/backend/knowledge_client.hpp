#pragma once

#include <timber_mcp/aws/http_transport.hpp>
#include <timber_mcp/backend/services.hpp>
#include <timber_mcp/backend/types.hpp>
#include <timber_mcp/config/app_config.hpp>
#include <timber_mcp/core/env.hpp>
#include <timber_mcp/core/log.hpp>

#include <memory>
#include <string_view>
#include <variant>

namespace timber_mcp {

constexpr int kRetrievalTopK = 5;
constexpr int kMaxOutputTokens = 1000;
constexpr double kSimulatedConfidence = 0.8;
constexpr double kGeneratedConfidence = 0.9;

// ---------------------------------------------------------------------------
// SimulatedBackend: deterministic placeholder answers, no I/O.
// ---------------------------------------------------------------------------
class SimulatedBackend {
public:
    [[nodiscard]] AnswerRecord Query(std::string_view text) const;
};

// Owns the live collaborators. `transport` may be null when the services
// do not need one (tests inject mock services directly).
struct LiveServices {
    std::unique_ptr<IHttpTransport> transport;
    std::unique_ptr<IRetrievalService> retrieval;
    std::unique_ptr<IGenerationService> generation;
};

// ---------------------------------------------------------------------------
// LiveBackend: retrieve, then generate over the retrieved context.
//
// Query() never throws: every failure becomes an AnswerRecord with
// Provenance::Error.
// ---------------------------------------------------------------------------
class LiveBackend {
public:
    LiveBackend(LiveServices services, BackendConfig config, Logger& logger);

    [[nodiscard]] AnswerRecord Query(std::string_view text);

private:
    AnswerRecord QueryUnchecked(std::string_view text);

    LiveServices services_;
    BackendConfig config_;
    Logger* logger_;
};

// ---------------------------------------------------------------------------
// KnowledgeClient: the backend handle, Simulated or Live.
//
// The mode is chosen once at construction and never changes.
// ---------------------------------------------------------------------------
class KnowledgeClient {
public:
    explicit KnowledgeClient(SimulatedBackend backend);
    explicit KnowledgeClient(LiveBackend backend);

    [[nodiscard]] AnswerRecord Query(std::string_view text);
    [[nodiscard]] BackendMode Mode() const noexcept;

private:
    std::variant<SimulatedBackend, LiveBackend> backend_;
};

// Build the client for `config`. A Live config whose collaborators cannot be
// initialised (missing credentials, unusable CA bundle) falls back to
// Simulated permanently; the reason is logged as a warning.
KnowledgeClient MakeKnowledgeClient(const BackendConfig& config,
                                    const EnvLookup& env,
                                    Logger& logger);

} // namespace timber_mcp
