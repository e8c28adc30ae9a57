#pragma once

#include <optional>
#include <string>
#include <vector>

namespace timber_mcp {

// ---------------------------------------------------------------------------
// Passage: one ranked text snippet from the retrieval service.
// ---------------------------------------------------------------------------
struct Passage {
    std::string text;
    std::optional<double> score;
    std::optional<std::string> source;  // e.g. the S3 URI of the document
};

// ---------------------------------------------------------------------------
// RetrievalResult: passages in rank order. Empty is a valid outcome.
// ---------------------------------------------------------------------------
struct RetrievalResult {
    std::vector<Passage> passages;

    [[nodiscard]] size_t Count() const noexcept { return passages.size(); }
    [[nodiscard]] bool Empty() const noexcept { return passages.empty(); }
};

enum class Provenance {
    LocalSimulation,
    KnowledgeBase,
    Error,
};

// "local_simulation", "knowledge_base" or "error".
const char* ProvenanceName(Provenance provenance);

// ---------------------------------------------------------------------------
// AnswerRecord: what a knowledge query produced.
// `retrieved_count` is set when generation ran over retrieved passages.
// ---------------------------------------------------------------------------
struct AnswerRecord {
    std::string text;
    Provenance provenance = Provenance::LocalSimulation;
    double confidence = 0.0;
    std::optional<size_t> retrieved_count;
};

} // namespace timber_mcp
