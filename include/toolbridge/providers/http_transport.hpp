#pragma once

#include <toolbridge/core/result.hpp>
#include <toolbridge/core/url.hpp>

#include <chrono>
#include <map>
#include <string>

namespace toolbridge {

using HttpHeaders = std::map<std::string, std::string>;

// One outbound HTTP request.
struct HttpCall {
    std::string method = "GET";  // GET, POST, PUT, DELETE or PATCH
    HttpUrl url;
    HttpHeaders headers;
    std::string body;
    std::string content_type = "application/json";
    std::chrono::seconds timeout{30};
};

struct HttpReply {
    int status = 0;
    std::string status_text;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// IHttpTransport: outbound HTTP used by the providers.
// ---------------------------------------------------------------------------
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    /// Send `call`. Any HTTP status is a successful send; only transport
    /// failures (DNS, connect, timeout, unsupported method) are errors.
    [[nodiscard]] virtual Result<HttpReply, Error> Send(const HttpCall& call) = 0;
};

// httplib-backed transport. One short-lived client per call.
class HttplibTransport : public IHttpTransport {
public:
    [[nodiscard]] Result<HttpReply, Error> Send(const HttpCall& call) override;
};

} // namespace toolbridge
