#include <timber_mcp/backend/prompt.hpp>

namespace timber_mcp {

namespace {

constexpr std::string_view kSeparator = "\n\n";

// Cut at `max_bytes` without splitting a UTF-8 sequence.
std::string Utf8Prefix(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) return text;
    size_t end = max_bytes;
    while (end > 0 &&
           (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
        --end;
    }
    return text.substr(0, end);
}

} // anonymous namespace

std::string BuildContextBlock(const RetrievalResult& retrieved, size_t max_chars) {
    std::string context;
    for (size_t i = 0; i < retrieved.passages.size(); ++i) {
        std::string entry = "Document " + std::to_string(i + 1) + ": " +
                            retrieved.passages[i].text;
        const size_t separator = context.empty() ? 0 : kSeparator.size();
        if (context.size() + separator + entry.size() <= max_chars) {
            if (separator) context += kSeparator;
            context += entry;
            continue;
        }
        if (context.size() + separator < max_chars) {
            if (separator) context += kSeparator;
            context += Utf8Prefix(entry, max_chars - context.size());
        }
        break;
    }
    return context;
}

std::string BuildAnswerPrompt(std::string_view query, std::string_view context) {
    std::string prompt;
    prompt += "Based on the following Timber documentation, answer the user's question: \"";
    prompt += query;
    prompt += "\"\n\nDocumentation:\n";
    prompt += context;
    prompt += "\n\nPlease provide a helpful and accurate answer based on the "
              "documentation provided.";
    return prompt;
}

} // namespace timber_mcp
