#pragma once

#include <timber_mcp/aws/http_transport.hpp>
#include <timber_mcp/aws/sigv4.hpp>
#include <timber_mcp/backend/services.hpp>
#include <timber_mcp/core/log.hpp>

#include <string>
#include <string_view>

namespace timber_mcp {

// ---------------------------------------------------------------------------
// BedrockRetrievalService: knowledge base Retrieve API
// (POST bedrock-agent-runtime.<region>.amazonaws.com/knowledgebases/<id>/retrieve).
// ---------------------------------------------------------------------------
class BedrockRetrievalService : public IRetrievalService {
public:
    BedrockRetrievalService(IHttpTransport& transport, SigV4Signer signer,
                            Logger& logger);

    [[nodiscard]] Result<RetrievalResult, Error> Retrieve(
        const KnowledgeBaseId& knowledge_base,
        std::string_view query,
        int max_results) override;

private:
    IHttpTransport& transport_;
    SigV4Signer signer_;
    Logger& logger_;
};

// ---------------------------------------------------------------------------
// BedrockGenerationService: InvokeModel with an Anthropic messages body
// (POST bedrock-runtime.<region>.amazonaws.com/model/<id>/invoke).
// ---------------------------------------------------------------------------
class BedrockGenerationService : public IGenerationService {
public:
    BedrockGenerationService(IHttpTransport& transport, SigV4Signer signer,
                             Logger& logger);

    [[nodiscard]] Result<std::string, Error> Generate(
        const ModelId& model,
        std::string_view prompt,
        int max_output_tokens) override;

private:
    IHttpTransport& transport_;
    SigV4Signer signer_;
    Logger& logger_;
};

namespace bedrock {

// Both services sign as "bedrock".
constexpr const char* kSigningService = "bedrock";

std::string AgentRuntimeHost(std::string_view region);
std::string RuntimeHost(std::string_view region);

std::string BuildRetrieveBody(std::string_view query, int max_results);
Result<RetrievalResult, Error> ParseRetrieveResponse(std::string_view body);

std::string BuildInvokeModelBody(std::string_view prompt, int max_output_tokens);
Result<std::string, Error> ParseInvokeModelResponse(std::string_view body);

} // namespace bedrock

} // namespace timber_mcp
