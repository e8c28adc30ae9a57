#pragma once

#include <timber_mcp/backend/types.hpp>

#include <string>
#include <string_view>

namespace timber_mcp {

// Label passages "Document 1: ...", "Document 2: ..." and join them with a
// blank line. The block never exceeds `max_chars`: the passage that crosses
// the limit is cut and the rest are dropped.
std::string BuildContextBlock(const RetrievalResult& retrieved, size_t max_chars);

// Single-turn instruction embedding the question and the context block.
std::string BuildAnswerPrompt(std::string_view query, std::string_view context);

} // namespace timber_mcp
