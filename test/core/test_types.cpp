#include <catch2/catch_test_macros.hpp>

#include <timber_mcp/core/types.hpp>

using namespace timber_mcp;

TEST_CASE("KnowledgeBaseId: accepts 10 alphanumerics", "[types]") {
    auto r = KnowledgeBaseId::Create("XQHHIEJ8MA");
    REQUIRE(r.IsOk());
    CHECK(r.Value().Value() == "XQHHIEJ8MA");
}

TEST_CASE("KnowledgeBaseId: rejects wrong length", "[types]") {
    CHECK(KnowledgeBaseId::Create("").IsErr());
    CHECK(KnowledgeBaseId::Create("ABC").IsErr());
    CHECK(KnowledgeBaseId::Create("ABCDEFGHIJK").IsErr());
}

TEST_CASE("KnowledgeBaseId: rejects punctuation", "[types]") {
    auto r = KnowledgeBaseId::Create("ABC-EFGHIJ");
    REQUIRE(r.IsErr());
    CHECK(r.Error().find("letters and digits") != std::string::npos);
}

TEST_CASE("ModelId: accepts model IDs and ARNs", "[types]") {
    CHECK(ModelId::Create("anthropic.claude-3-haiku-20240307-v1:0").IsOk());
    CHECK(ModelId::Create(
              "arn:aws:bedrock:us-east-1:123456789012:inference-profile/"
              "us.anthropic.claude-3-haiku-20240307-v1:0")
              .IsOk());
}

TEST_CASE("ModelId: rejects empty and spaces", "[types]") {
    CHECK(ModelId::Create("").IsErr());
    CHECK(ModelId::Create("anthropic claude").IsErr());
}

TEST_CASE("AwsRegion: accepts region codes", "[types]") {
    CHECK(AwsRegion::Create("us-east-1").IsOk());
    CHECK(AwsRegion::Create("eu-central-1").IsOk());
    CHECK(AwsRegion::Create("us-gov-west-1").IsOk());
}

TEST_CASE("AwsRegion: rejects malformed codes", "[types]") {
    CHECK(AwsRegion::Create("").IsErr());
    CHECK(AwsRegion::Create("US-EAST-1").IsErr());
    CHECK(AwsRegion::Create("useast1").IsErr());
    CHECK(AwsRegion::Create("us-east-").IsErr());
    CHECK(AwsRegion::Create("1us-east-1").IsErr());
}

TEST_CASE("Value types: equality compares the value", "[types]") {
    CHECK(AwsRegion::Create("us-east-1").Value() == AwsRegion::Create("us-east-1").Value());
    CHECK(AwsRegion::Create("us-east-1").Value() != AwsRegion::Create("us-west-2").Value());
}
