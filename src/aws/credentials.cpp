#include <timber_mcp/aws/credentials.hpp>

namespace timber_mcp {

namespace {

Error MakeCredentialsError(const std::string& message) {
    return Error{"LoadCredentials", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Credentials};
}

std::optional<std::string> NonEmpty(std::optional<std::string> value) {
    if (value && value->empty()) return std::nullopt;
    return value;
}

} // anonymous namespace

Result<AwsCredentials, Error> LoadCredentialsFromEnv(const EnvLookup& env) {
    auto access_key = NonEmpty(env("AWS_ACCESS_KEY_ID"));
    auto secret_key = NonEmpty(env("AWS_SECRET_ACCESS_KEY"));

    if (!access_key && !secret_key) {
        return Result<AwsCredentials, Error>::Err(MakeCredentialsError(
            "AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY are not set"));
    }
    if (!access_key) {
        return Result<AwsCredentials, Error>::Err(
            MakeCredentialsError("AWS_ACCESS_KEY_ID is not set"));
    }
    if (!secret_key) {
        return Result<AwsCredentials, Error>::Err(
            MakeCredentialsError("AWS_SECRET_ACCESS_KEY is not set"));
    }

    return Result<AwsCredentials, Error>::Ok(AwsCredentials{
        std::move(*access_key),
        std::move(*secret_key),
        NonEmpty(env("AWS_SESSION_TOKEN")),
    });
}

} // namespace timber_mcp
