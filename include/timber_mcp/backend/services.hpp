#pragma once

#include <timber_mcp/backend/types.hpp>
#include <timber_mcp/core/result.hpp>
#include <timber_mcp/core/types.hpp>

#include <string>
#include <string_view>

namespace timber_mcp {

// ---------------------------------------------------------------------------
// IRetrievalService: document search returning ranked passages.
// ---------------------------------------------------------------------------
class IRetrievalService {
public:
    virtual ~IRetrievalService() = default;

    [[nodiscard]] virtual Result<RetrievalResult, Error> Retrieve(
        const KnowledgeBaseId& knowledge_base,
        std::string_view query,
        int max_results) = 0;
};

// ---------------------------------------------------------------------------
// IGenerationService: single-turn text generation.
// Returns the first generated text segment.
// ---------------------------------------------------------------------------
class IGenerationService {
public:
    virtual ~IGenerationService() = default;

    [[nodiscard]] virtual Result<std::string, Error> Generate(
        const ModelId& model,
        std::string_view prompt,
        int max_output_tokens) = 0;
};

} // namespace timber_mcp
