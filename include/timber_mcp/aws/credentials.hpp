#pragma once

#include <timber_mcp/core/env.hpp>
#include <timber_mcp/core/result.hpp>

#include <optional>
#include <string>

namespace timber_mcp {

// ---------------------------------------------------------------------------
// AwsCredentials: static access key pair, optionally with a session token
// for temporary (STS) credentials.
// ---------------------------------------------------------------------------
struct AwsCredentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::optional<std::string> session_token;
};

// Read AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY and AWS_SESSION_TOKEN.
// Fails with ErrorCategory::Credentials when the key pair is incomplete.
Result<AwsCredentials, Error> LoadCredentialsFromEnv(const EnvLookup& env);

} // namespace timber_mcp
