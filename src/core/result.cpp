#include <timber_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

namespace timber_mcp {

namespace {

// AWS JSON services report errors as {"message": "..."} or {"Message": "..."}.
// The error type is carried in the x-amzn-ErrorType header or "__type".
std::optional<std::string> ExtractAwsError(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto parsed = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;

    for (const char* key : {"message", "Message"}) {
        auto it = parsed.find(key);
        if (it != parsed.end() && it->is_string() &&
            !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    auto type = parsed.find("__type");
    if (type != parsed.end() && type->is_string()) {
        return type->get<std::string>();
    }
    return std::nullopt;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto service_error = ExtractAwsError(response_body);

    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 400:
            category = ErrorCategory::Http;
            message = "Bad request";
            break;
        case 401:
        case 403:
            category = ErrorCategory::Credentials;
            message = "Access denied; check AWS credentials and permissions";
            break;
        case 404:
            category = ErrorCategory::NotFound;
            message = "Resource not found";
            break;
        case 408:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 424:
            category = ErrorCategory::Backend;
            message = "Dependency failed";
            break;
        case 429:
            category = ErrorCategory::Throttled;
            message = "Too many requests; retry later";
            break;
        case 500:
            category = ErrorCategory::Backend;
            message = "Service internal error";
            break;
        case 502:
        case 503:
        case 504:
            category = ErrorCategory::Connection;
            message = "Service unavailable";
            break;
        default:
            category = ErrorCategory::Http;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    return Error{operation, endpoint, status_code, message, service_error, category};
}

} // namespace timber_mcp
