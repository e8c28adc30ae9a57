#include <catch2/catch_test_macros.hpp>

#include <timber_mcp/aws/sigv4.hpp>

#include <chrono>
#include <string>

using namespace timber_mcp;

namespace {

// AWS documentation example: IAM ListUsers at 2015-08-30T12:36:00Z.
constexpr const char* kAccessKey = "AKIDEXAMPLE";
constexpr const char* kSecretKey = "wJalrXUtnFEMI/K7MDENG+bPxRfiCYEXAMPLEKEY";

std::chrono::system_clock::time_point ExampleTime() {
    return std::chrono::system_clock::time_point(std::chrono::seconds(1440938160));
}

SignableRequest ListUsersRequest() {
    SignableRequest req;
    req.method = "GET";
    req.host = "iam.amazonaws.com";
    req.path = "/";
    req.query = {{"Action", "ListUsers"}, {"Version", "2010-05-08"}};
    req.headers["Content-Type"] = "application/x-www-form-urlencoded; charset=utf-8";
    return req;
}

} // anonymous namespace

// ===========================================================================
// Primitives
// ===========================================================================

TEST_CASE("sigv4::Sha256Hex: empty string", "[aws][sigv4]") {
    CHECK(sigv4::Sha256Hex("") ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("sigv4::FormatAmzDate: UTC basic format", "[aws][sigv4]") {
    CHECK(sigv4::FormatAmzDate(ExampleTime()) == "20150830T123600Z");
}

TEST_CASE("sigv4::DeriveSigningKey: documented example", "[aws][sigv4]") {
    auto key = sigv4::DeriveSigningKey(kSecretKey, "20150830", "us-east-1", "iam");
    CHECK(sigv4::HexEncode(key) ==
          "c4afb1cc5771d871763a393e44b703571b55cc28424d1a5e86da6ed3c154a4b9");
}

TEST_CASE("sigv4::CanonicalRequest: sorted lowercase headers", "[aws][sigv4]") {
    auto req = ListUsersRequest();
    HttpHeaders headers = req.headers;
    headers["Host"] = req.host;
    headers["X-Amz-Date"] = "20150830T123600Z";

    std::string signed_headers;
    auto canonical = sigv4::CanonicalRequest(req, headers, &signed_headers);

    CHECK(signed_headers == "content-type;host;x-amz-date");
    CHECK(canonical ==
          "GET\n"
          "/\n"
          "Action=ListUsers&Version=2010-05-08\n"
          "content-type:application/x-www-form-urlencoded; charset=utf-8\n"
          "host:iam.amazonaws.com\n"
          "x-amz-date:20150830T123600Z\n"
          "\n"
          "content-type;host;x-amz-date\n"
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("sigv4::CanonicalRequest: path segments are encoded twice", "[aws][sigv4]") {
    SignableRequest req;
    req.host = "bedrock-runtime.us-east-1.amazonaws.com";
    req.path = "/model/anthropic.claude-3-haiku-20240307-v1%3A0/invoke";
    HttpHeaders headers{{"Host", req.host}};

    auto canonical = sigv4::CanonicalRequest(req, headers, nullptr);
    CHECK(canonical.find("POST\n/model/anthropic.claude-3-haiku-20240307-v1%253A0/invoke\n") == 0);
}

// ===========================================================================
// SigV4Signer
// ===========================================================================

TEST_CASE("SigV4Signer: documented example signature", "[aws][sigv4]") {
    SigV4Signer signer(AwsCredentials{kAccessKey, kSecretKey, std::nullopt},
                       "us-east-1", "iam");

    auto headers = signer.Sign(ListUsersRequest(), ExampleTime());

    CHECK(headers.at("X-Amz-Date") == "20150830T123600Z");
    CHECK(headers.count("X-Amz-Security-Token") == 0);
    CHECK(headers.at("Authorization") ==
          "AWS4-HMAC-SHA256 "
          "Credential=AKIDEXAMPLE/20150830/us-east-1/iam/aws4_request, "
          "SignedHeaders=content-type;host;x-amz-date, "
          "Signature=5d672d79c15b13162d9279b0855cfba6789a8edb4c82c400e06b5924a6f2b5d7");
}

TEST_CASE("SigV4Signer: session token is added and signed", "[aws][sigv4]") {
    SigV4Signer signer(AwsCredentials{kAccessKey, kSecretKey, std::string("tok")},
                       "us-east-1", "bedrock");

    auto headers = signer.Sign(ListUsersRequest(), ExampleTime());

    CHECK(headers.at("X-Amz-Security-Token") == "tok");
    CHECK(headers.at("Authorization").find(
              "SignedHeaders=content-type;host;x-amz-date;x-amz-security-token") !=
          std::string::npos);
    CHECK(signer.Region() == "us-east-1");
    CHECK(signer.Service() == "bedrock");
}

TEST_CASE("SigV4Signer: body changes the signature", "[aws][sigv4]") {
    SigV4Signer signer(AwsCredentials{kAccessKey, kSecretKey, std::nullopt},
                       "us-east-1", "bedrock");
    SignableRequest a;
    a.host = "bedrock-runtime.us-east-1.amazonaws.com";
    a.path = "/model/m/invoke";
    a.body = R"({"a":1})";
    SignableRequest b = a;
    b.body = R"({"a":2})";

    CHECK(signer.Sign(a, ExampleTime()).at("Authorization") !=
          signer.Sign(b, ExampleTime()).at("Authorization"));
}
