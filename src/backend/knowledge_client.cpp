#include <timber_mcp/backend/knowledge_client.hpp>

#include <timber_mcp/aws/credentials.hpp>
#include <timber_mcp/aws/sigv4.hpp>
#include <timber_mcp/backend/bedrock.hpp>
#include <timber_mcp/backend/prompt.hpp>

#include <exception>

namespace timber_mcp {

namespace {

AnswerRecord MakeBackendErrorAnswer(const std::string& description) {
    return AnswerRecord{"Error querying knowledge base: " + description,
                        Provenance::Error, 0.0, std::nullopt};
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// SimulatedBackend
// ---------------------------------------------------------------------------
AnswerRecord SimulatedBackend::Query(std::string_view text) const {
    return AnswerRecord{"[LOCAL MODE] Simulated response for: " + std::string(text),
                        Provenance::LocalSimulation, kSimulatedConfidence,
                        std::nullopt};
}

// ---------------------------------------------------------------------------
// LiveBackend
// ---------------------------------------------------------------------------
LiveBackend::LiveBackend(LiveServices services, BackendConfig config, Logger& logger)
    : services_(std::move(services)), config_(std::move(config)), logger_(&logger) {}

AnswerRecord LiveBackend::Query(std::string_view text) {
    try {
        return QueryUnchecked(text);
    } catch (const std::exception& e) {
        logger_->Error("backend", std::string("Knowledge base query failed: ") + e.what());
        return MakeBackendErrorAnswer(e.what());
    }
}

AnswerRecord LiveBackend::QueryUnchecked(std::string_view text) {
    auto retrieved = services_.retrieval->Retrieve(config_.knowledge_base_id, text,
                                                   kRetrievalTopK);
    if (retrieved.IsErr()) {
        logger_->Error("backend", "Knowledge base query failed: " +
                                      retrieved.Error().ToString());
        return MakeBackendErrorAnswer(retrieved.Error().ToString());
    }

    const auto& passages = retrieved.Value();
    logger_->Info("backend", "Retrieved " + std::to_string(passages.Count()) +
                                 " passage(s)");
    if (passages.Empty()) {
        return AnswerRecord{"No relevant information found in the Timber knowledge base.",
                            Provenance::KnowledgeBase, 0.0, std::nullopt};
    }

    const auto context = BuildContextBlock(
        passages, static_cast<size_t>(config_.max_context_chars));
    const auto prompt = BuildAnswerPrompt(text, context);

    auto generated = services_.generation->Generate(config_.model_id, prompt,
                                                    kMaxOutputTokens);
    if (generated.IsErr()) {
        logger_->Error("backend", "Knowledge base query failed: " +
                                      generated.Error().ToString());
        return MakeBackendErrorAnswer(generated.Error().ToString());
    }

    return AnswerRecord{std::move(generated).Value(), Provenance::KnowledgeBase,
                        kGeneratedConfidence, passages.Count()};
}

// ---------------------------------------------------------------------------
// KnowledgeClient
// ---------------------------------------------------------------------------
KnowledgeClient::KnowledgeClient(SimulatedBackend backend)
    : backend_(std::move(backend)) {}

KnowledgeClient::KnowledgeClient(LiveBackend backend)
    : backend_(std::move(backend)) {}

AnswerRecord KnowledgeClient::Query(std::string_view text) {
    return std::visit([text](auto& backend) { return backend.Query(text); }, backend_);
}

BackendMode KnowledgeClient::Mode() const noexcept {
    return std::holds_alternative<LiveBackend>(backend_) ? BackendMode::Live
                                                         : BackendMode::Simulated;
}

KnowledgeClient MakeKnowledgeClient(const BackendConfig& config,
                                    const EnvLookup& env,
                                    Logger& logger) {
    if (config.mode == BackendMode::Simulated) {
        logger.Info("backend", "Using simulated backend");
        return KnowledgeClient(SimulatedBackend{});
    }

    auto credentials = LoadCredentialsFromEnv(env);
    if (credentials.IsErr()) {
        logger.Error("backend", "Failed to initialize Bedrock clients: " +
                                    credentials.Error().ToString());
        logger.Warn("backend", "Falling back to simulated backend");
        return KnowledgeClient(SimulatedBackend{});
    }

    HttpTransportOptions options;
    options.connect_timeout = std::chrono::seconds(config.connect_timeout_seconds);
    options.read_timeout = std::chrono::seconds(config.read_timeout_seconds);
    options.ca_bundle = env("AWS_CA_BUNDLE");
    auto transport = HttpTransport::Create(options, logger);
    if (transport.IsErr()) {
        logger.Error("backend", "Failed to initialize Bedrock clients: " +
                                    transport.Error().ToString());
        logger.Warn("backend", "Falling back to simulated backend");
        return KnowledgeClient(SimulatedBackend{});
    }

    LiveServices services;
    services.transport = std::move(transport).Value();
    const auto& region = config.region.Value();
    services.retrieval = std::make_unique<BedrockRetrievalService>(
        *services.transport,
        SigV4Signer(credentials.Value(), region, bedrock::kSigningService), logger);
    services.generation = std::make_unique<BedrockGenerationService>(
        *services.transport,
        SigV4Signer(credentials.Value(), region, bedrock::kSigningService), logger);

    logger.Info("backend", "Initialized Bedrock clients for KB: " +
                               config.knowledge_base_id.Value() + " in " + region);
    return KnowledgeClient(LiveBackend(std::move(services), config, logger));
}

} // namespace timber_mcp
