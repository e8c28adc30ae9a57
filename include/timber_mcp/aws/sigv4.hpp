#pragma once

#include <timber_mcp/aws/credentials.hpp>
#include <timber_mcp/aws/http_transport.hpp>

#include <chrono>
#include <map>
#include <string>
#include <string_view>

namespace timber_mcp {

// ---------------------------------------------------------------------------
// SignableRequest: the parts of an HTTP request covered by a SigV4 signature.
//
// `path` is the percent-encoded path as sent on the wire. `query` holds
// decoded parameter names and values. `headers` must not contain Host or
// X-Amz-Date; the signer adds both.
// ---------------------------------------------------------------------------
struct SignableRequest {
    std::string method = "POST";
    std::string host;
    std::string path = "/";
    std::map<std::string, std::string> query;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// SigV4Signer: AWS Signature Version 4 (AWS4-HMAC-SHA256) for one
// region/service pair.
// ---------------------------------------------------------------------------
class SigV4Signer {
public:
    SigV4Signer(AwsCredentials credentials, std::string region, std::string service);

    // Headers to add to the request: Authorization, X-Amz-Date and, for
    // temporary credentials, X-Amz-Security-Token.
    [[nodiscard]] HttpHeaders Sign(const SignableRequest& request) const;
    [[nodiscard]] HttpHeaders Sign(const SignableRequest& request,
                                   std::chrono::system_clock::time_point now) const;

    [[nodiscard]] const std::string& Region() const noexcept { return region_; }
    [[nodiscard]] const std::string& Service() const noexcept { return service_; }

private:
    AwsCredentials credentials_;
    std::string region_;
    std::string service_;
};

namespace sigv4 {

// Lowercase hex SHA-256 of `data`.
std::string Sha256Hex(std::string_view data);

// Raw HMAC-SHA256 of `data` under `key`.
std::string HmacSha256(std::string_view key, std::string_view data);

std::string HexEncode(std::string_view bytes);

// "YYYYMMDDTHHMMSSZ" in UTC.
std::string FormatAmzDate(std::chrono::system_clock::time_point time);

// kSigning = HMAC(HMAC(HMAC(HMAC("AWS4" + secret, date), region), service),
//                 "aws4_request")
std::string DeriveSigningKey(std::string_view secret_access_key,
                             std::string_view date_stamp,
                             std::string_view region,
                             std::string_view service);

// Canonical request for non-S3 services: every path segment is encoded a
// second time. `headers` must already include host and x-amz-date.
std::string CanonicalRequest(const SignableRequest& request,
                             const HttpHeaders& headers,
                             std::string* signed_headers);

} // namespace sigv4

} // namespace timber_mcp
