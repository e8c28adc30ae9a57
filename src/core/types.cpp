#include <timber_mcp/core/types.hpp>

#include <algorithm>

namespace timber_mcp {

namespace {

bool IsAsciiAlnum(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9');
}

bool IsModelIdChar(char c) {
    return IsAsciiAlnum(c) || c == '.' || c == '-' || c == '_' ||
           c == ':' || c == '/';
}

bool IsRegionChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// KnowledgeBaseId
// ---------------------------------------------------------------------------
Result<KnowledgeBaseId, std::string> KnowledgeBaseId::Create(std::string_view id) {
    if (id.size() != 10) {
        return Result<KnowledgeBaseId, std::string>::Err(
            "Knowledge base ID must be exactly 10 characters, got " +
            std::to_string(id.size()));
    }
    if (!std::all_of(id.begin(), id.end(), IsAsciiAlnum)) {
        return Result<KnowledgeBaseId, std::string>::Err(
            "Knowledge base ID must contain only letters and digits");
    }
    return Result<KnowledgeBaseId, std::string>::Ok(KnowledgeBaseId(std::string(id)));
}

// ---------------------------------------------------------------------------
// ModelId
// ---------------------------------------------------------------------------
Result<ModelId, std::string> ModelId::Create(std::string_view id) {
    if (id.empty()) {
        return Result<ModelId, std::string>::Err("Model ID must not be empty");
    }
    if (id.size() > 2048) {
        return Result<ModelId, std::string>::Err(
            "Model ID must be at most 2048 characters");
    }
    if (!std::all_of(id.begin(), id.end(), IsModelIdChar)) {
        return Result<ModelId, std::string>::Err(
            "Model ID contains invalid characters: " + std::string(id));
    }
    return Result<ModelId, std::string>::Ok(ModelId(std::string(id)));
}

// ---------------------------------------------------------------------------
// AwsRegion
// ---------------------------------------------------------------------------
Result<AwsRegion, std::string> AwsRegion::Create(std::string_view region) {
    if (region.size() < 4 || region.size() > 32) {
        return Result<AwsRegion, std::string>::Err(
            "AWS region must be 4 to 32 characters: " + std::string(region));
    }
    if (!std::all_of(region.begin(), region.end(), IsRegionChar)) {
        return Result<AwsRegion, std::string>::Err(
            "AWS region must contain only lowercase letters, digits and hyphens");
    }
    if (region.front() < 'a' || region.front() > 'z' ||
        region.back() < '0' || region.back() > '9' ||
        region.find('-') == std::string_view::npos) {
        return Result<AwsRegion, std::string>::Err(
            "AWS region must look like 'us-east-1': " + std::string(region));
    }
    return Result<AwsRegion, std::string>::Ok(AwsRegion(std::string(region)));
}

} // namespace timber_mcp
