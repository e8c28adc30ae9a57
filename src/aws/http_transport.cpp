#include <timber_mcp/aws/http_transport.hpp>

#include <httplib.h>

#include <fstream>

namespace timber_mcp {

namespace {

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

bool IsSensitiveHeader(const std::string& name) {
    return name == "Authorization" || name == "X-Amz-Security-Token";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl: one httplib::Client per host, created on first use.
// ---------------------------------------------------------------------------
struct HttpTransport::Impl {
    HttpTransportOptions options;
    Logger& logger;
    std::map<std::string, std::unique_ptr<httplib::Client>> clients;

    Impl(const HttpTransportOptions& opts, Logger& log)
        : options(opts), logger(log) {}

    httplib::Client& ClientFor(const std::string& host) {
        auto it = clients.find(host);
        if (it != clients.end()) {
            return *it->second;
        }
        auto client = std::make_unique<httplib::Client>("https://" + host);
        client->set_connection_timeout(options.connect_timeout);
        client->set_read_timeout(options.read_timeout);
        client->set_keep_alive(true);
        if (options.ca_bundle) {
            client->set_ca_cert_path(*options.ca_bundle);
        }
        auto& ref = *client;
        clients.emplace(host, std::move(client));
        return ref;
    }
};

HttpTransport::HttpTransport(const HttpTransportOptions& options, Logger& logger)
    : impl_(std::make_unique<Impl>(options, logger)) {}

HttpTransport::~HttpTransport() = default;

Result<std::unique_ptr<HttpTransport>, Error> HttpTransport::Create(
    const HttpTransportOptions& options, Logger& logger) {
    if (options.ca_bundle) {
        std::ifstream bundle(*options.ca_bundle);
        if (!bundle) {
            return Result<std::unique_ptr<HttpTransport>, Error>::Err(Error{
                "CreateHttpTransport", *options.ca_bundle, std::nullopt,
                "CA bundle is not readable", std::nullopt,
                ErrorCategory::Config});
        }
    }
    return Result<std::unique_ptr<HttpTransport>, Error>::Ok(
        std::unique_ptr<HttpTransport>(new HttpTransport(options, logger)));
}

Result<HttpResponse, Error> HttpTransport::Post(const HttpRequest& request) {
    httplib::Headers hdrs;
    std::string content_type = "application/json";
    for (const auto& [key, value] : request.headers) {
        if (key == "Content-Type") {
            content_type = value;
            continue;
        }
        hdrs.emplace(key, value);
    }

    impl_->logger.Info("http", "POST https://" + request.host + request.path);
    for (const auto& [key, value] : hdrs) {
        impl_->logger.Debug("http", "  > " + key + ": " +
                                        (IsSensitiveHeader(key) ? "<redacted>" : value));
    }

    auto& client = impl_->ClientFor(request.host);
    auto res = client.Post(request.path, hdrs, request.body, content_type);
    if (!res) {
        const auto http_error = res.error();
        return Result<HttpResponse, Error>::Err(Error{
            "Post", request.host + request.path, std::nullopt,
            "HTTP request failed: " + httplib::to_string(http_error),
            std::nullopt, CategoryFromHttpTransportError(http_error)});
    }

    impl_->logger.Debug("http", "  < HTTP " + std::to_string(res->status) +
                                    " (" + std::to_string(res->body.size()) + " bytes)");
    if (res->status >= 400 && !res->body.empty()) {
        constexpr size_t kMaxBodyLog = 2000;
        if (res->body.size() <= kMaxBodyLog) {
            impl_->logger.Debug("http", "  < body: " + res->body);
        } else {
            impl_->logger.Debug("http", "  < body: " + res->body.substr(0, kMaxBodyLog) +
                                            "... (truncated)");
        }
    }

    return Result<HttpResponse, Error>::Ok(
        HttpResponse{res->status, ToHttpHeaders(res->headers), res->body});
}

} // namespace timber_mcp
