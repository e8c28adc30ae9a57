#include <timber_mcp/aws/sigv4.hpp>

#include <timber_mcp/core/url.hpp>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace timber_mcp {

namespace {

constexpr const char* kAlgorithm = "AWS4-HMAC-SHA256";

std::string ToLower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

// Trim surrounding whitespace and collapse inner runs to one space.
std::string CanonicalHeaderValue(std::string_view value) {
    std::string out;
    bool pending_space = false;
    for (char c : value) {
        if (c == ' ' || c == '\t') {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += c;
    }
    return out;
}

} // anonymous namespace

namespace sigv4 {

std::string HexEncode(std::string_view bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char c : bytes) {
        oss << std::setw(2) << static_cast<int>(c);
    }
    return oss.str();
}

std::string Sha256Hex(std::string_view data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);
    return HexEncode(std::string_view(reinterpret_cast<const char*>(digest),
                                      SHA256_DIGEST_LENGTH));
}

std::string HmacSha256(std::string_view key, std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         digest, &length);
    return std::string(reinterpret_cast<const char*>(digest), length);
}

std::string FormatAmzDate(std::chrono::system_clock::time_point time) {
    const auto time_t_value = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &time_t_value);
#else
    gmtime_r(&time_t_value, &utc);
#endif
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y%m%dT%H%M%SZ");
    return oss.str();
}

std::string DeriveSigningKey(std::string_view secret_access_key,
                             std::string_view date_stamp,
                             std::string_view region,
                             std::string_view service) {
    auto k_date = HmacSha256("AWS4" + std::string(secret_access_key), date_stamp);
    auto k_region = HmacSha256(k_date, region);
    auto k_service = HmacSha256(k_region, service);
    return HmacSha256(k_service, "aws4_request");
}

std::string CanonicalRequest(const SignableRequest& request,
                             const HttpHeaders& headers,
                             std::string* signed_headers) {
    std::ostringstream oss;
    oss << request.method << '\n';
    oss << (request.path.empty() ? "/" : UrlEncodePath(request.path)) << '\n';

    // std::map keeps the query sorted by name.
    bool first = true;
    for (const auto& [name, value] : request.query) {
        if (!first) oss << '&';
        oss << UrlEncode(name) << '=' << UrlEncode(value);
        first = false;
    }
    oss << '\n';

    std::map<std::string, std::string> canonical;
    for (const auto& [name, value] : headers) {
        canonical[ToLower(name)] = CanonicalHeaderValue(value);
    }
    std::string names;
    for (const auto& [name, value] : canonical) {
        oss << name << ':' << value << '\n';
        if (!names.empty()) names += ';';
        names += name;
    }
    oss << '\n' << names << '\n';
    oss << Sha256Hex(request.body);

    if (signed_headers != nullptr) {
        *signed_headers = names;
    }
    return oss.str();
}

} // namespace sigv4

// ---------------------------------------------------------------------------
// SigV4Signer
// ---------------------------------------------------------------------------
SigV4Signer::SigV4Signer(AwsCredentials credentials, std::string region,
                         std::string service)
    : credentials_(std::move(credentials)),
      region_(std::move(region)),
      service_(std::move(service)) {}

HttpHeaders SigV4Signer::Sign(const SignableRequest& request) const {
    return Sign(request, std::chrono::system_clock::now());
}

HttpHeaders SigV4Signer::Sign(const SignableRequest& request,
                              std::chrono::system_clock::time_point now) const {
    const auto amz_date = sigv4::FormatAmzDate(now);
    const auto date_stamp = amz_date.substr(0, 8);
    const auto scope = date_stamp + "/" + region_ + "/" + service_ + "/aws4_request";

    HttpHeaders added;
    added["X-Amz-Date"] = amz_date;
    if (credentials_.session_token) {
        added["X-Amz-Security-Token"] = *credentials_.session_token;
    }

    HttpHeaders signed_set = request.headers;
    signed_set["Host"] = request.host;
    for (const auto& [name, value] : added) {
        signed_set[name] = value;
    }

    std::string signed_headers;
    const auto canonical = sigv4::CanonicalRequest(request, signed_set, &signed_headers);

    const auto string_to_sign = std::string(kAlgorithm) + "\n" + amz_date + "\n" +
                                scope + "\n" + sigv4::Sha256Hex(canonical);

    const auto signing_key = sigv4::DeriveSigningKey(
        credentials_.secret_access_key, date_stamp, region_, service_);
    const auto signature =
        sigv4::HexEncode(sigv4::HmacSha256(signing_key, string_to_sign));

    added["Authorization"] = std::string(kAlgorithm) +
                             " Credential=" + credentials_.access_key_id + "/" + scope +
                             ", SignedHeaders=" + signed_headers +
                             ", Signature=" + signature;
    return added;
}

} // namespace timber_mcp
