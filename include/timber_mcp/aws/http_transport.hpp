#pragma once

#include <timber_mcp/core/log.hpp>
#include <timber_mcp/core/result.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace timber_mcp {

// ---------------------------------------------------------------------------
// HttpHeaders: header name to value. Names are case-sensitive here;
// callers normalise as needed.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// HttpRequest: an HTTPS POST to `host` (port 443).
// `path` is sent as-is and must already be percent-encoded.
// ---------------------------------------------------------------------------
struct HttpRequest {
    std::string host;
    std::string path;
    std::string body;
    HttpHeaders headers;
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// IHttpTransport: abstract HTTPS client used by the Bedrock services.
//
// Returns Result<HttpResponse, Error>: transport failures (DNS, TLS, timeout)
// are errors; any HTTP status, including 4xx/5xx, is a response. Enables
// offline testing via MockHttpTransport.
// ---------------------------------------------------------------------------
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    IHttpTransport(const IHttpTransport&) = delete;
    IHttpTransport& operator=(const IHttpTransport&) = delete;
    IHttpTransport(IHttpTransport&&) = delete;
    IHttpTransport& operator=(IHttpTransport&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Post(const HttpRequest& request) = 0;

protected:
    IHttpTransport() = default;
};

struct HttpTransportOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{60};
    // PEM bundle used instead of the system trust store (AWS_CA_BUNDLE).
    std::optional<std::string> ca_bundle;
};

// ---------------------------------------------------------------------------
// HttpTransport: IHttpTransport over cpp-httplib with OpenSSL.
//
// Keeps one keep-alive client per host. Uses pimpl so httplib does not leak
// into the public header.
// ---------------------------------------------------------------------------
class HttpTransport : public IHttpTransport {
public:
    // Fails when the CA bundle is configured but unreadable.
    static Result<std::unique_ptr<HttpTransport>, Error> Create(
        const HttpTransportOptions& options, Logger& logger);

    ~HttpTransport() override;

    [[nodiscard]] Result<HttpResponse, Error> Post(const HttpRequest& request) override;

private:
    HttpTransport(const HttpTransportOptions& options, Logger& logger);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace timber_mcp
