#pragma once

#include <cassert>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <variant>

namespace timber_mcp {

// ---------------------------------------------------------------------------
// Result<T, E>: a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E>: for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory: classifies errors for exit codes and log output.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Config,
    Credentials,
    Connection,
    Timeout,
    Throttled,
    NotFound,
    Http,
    Protocol,
    Backend,
    Internal,
};

// ---------------------------------------------------------------------------
// Error: structured error for config, transport and backend operations.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string endpoint;
    std::optional<int> http_status;
    std::string message;
    std::optional<std::string> service_error;
    ErrorCategory category = ErrorCategory::Internal;

    /// Create an Error from an HTTP status code. Extracts the AWS error
    /// message from a JSON response body when one is present.
    static Error FromHttpStatus(const std::string& operation,
                                const std::string& endpoint,
                                int status_code,
                                const std::string& response_body = "");

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::Config:      return 2;
            case ErrorCategory::Credentials: return 1;
            case ErrorCategory::Connection:  return 1;
            case ErrorCategory::Timeout:     return 1;
            case ErrorCategory::Throttled:   return 1;
            case ErrorCategory::NotFound:    return 1;
            case ErrorCategory::Http:        return 1;
            case ErrorCategory::Protocol:    return 1;
            case ErrorCategory::Backend:     return 1;
            case ErrorCategory::Internal:    return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string ToString() const {
        std::ostringstream oss;
        oss << operation;
        if (!endpoint.empty()) {
            oss << " [" << endpoint << "]";
        }
        if (http_status.has_value()) {
            oss << " (HTTP " << *http_status << ")";
        }
        oss << ": " << message;
        if (service_error.has_value() && !service_error->empty()) {
            oss << " (" << *service_error << ")";
        }
        return oss.str();
    }
};

} // namespace timber_mcp
