#pragma once

#include <timber_mcp/core/result.hpp>

#include <string>
#include <string_view>

namespace timber_mcp {

// ---------------------------------------------------------------------------
// KnowledgeBaseId: validated Bedrock knowledge base identifier.
//
// Rules:
//   - Exactly 10 characters
//   - ASCII letters and digits only
// ---------------------------------------------------------------------------
class KnowledgeBaseId {
public:
    static Result<KnowledgeBaseId, std::string> Create(std::string_view id);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const KnowledgeBaseId& other) const { return value_ == other.value_; }
    bool operator!=(const KnowledgeBaseId& other) const { return value_ != other.value_; }

private:
    explicit KnowledgeBaseId(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// ModelId: Bedrock model identifier or inference profile ARN.
//
// Rules:
//   - Non-empty, max 2048 characters
//   - Letters, digits and '.', '-', '_', ':', '/'
// ---------------------------------------------------------------------------
class ModelId {
public:
    static Result<ModelId, std::string> Create(std::string_view id);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ModelId& other) const { return value_ == other.value_; }
    bool operator!=(const ModelId& other) const { return value_ != other.value_; }

private:
    explicit ModelId(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// AwsRegion: region code such as "us-east-1" or "eu-central-1".
// Lowercase letters, digits and hyphens; must start with a letter and end
// with a digit.
// ---------------------------------------------------------------------------
class AwsRegion {
public:
    static Result<AwsRegion, std::string> Create(std::string_view region);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const AwsRegion& other) const { return value_ == other.value_; }
    bool operator!=(const AwsRegion& other) const { return value_ != other.value_; }

private:
    explicit AwsRegion(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

} // namespace timber_mcp
