#pragma once

#include <toolbridge/protocol/dispatcher.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>

#include <nlohmann/json.hpp>

namespace httplib {
class Server;
}

namespace toolbridge {

struct GatewayOptions {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    // Value of Access-Control-Allow-Origin. Empty disables CORS headers.
    std::string cors_origin = "*";
};

// Status code and JSON body of one gateway response.
struct GatewayReply {
    int status = 200;
    nlohmann::json body;
};

// ---------------------------------------------------------------------------
// HttpGateway: REST projection of the envelope protocol.
//
//   GET  /health          -> {status, version}
//   GET  /capabilities    -> {capabilities: [...]}   (alias GET /tools)
//   POST /invoke          -> {success, result, content, error}
//                            (alias POST /tools/call)
//   OPTIONS *             -> 204 preflight
//
// /invoke builds a request envelope with a fresh correlation id and hands
// it to the dispatcher, so both transports share one code path. Failure
// statuses come from the error taxonomy (HttpStatusFor).
// ---------------------------------------------------------------------------
class HttpGateway {
public:
    explicit HttpGateway(ProtocolDispatcher& dispatcher, GatewayOptions options = {});
    ~HttpGateway();

    HttpGateway(const HttpGateway&) = delete;
    HttpGateway& operator=(const HttpGateway&) = delete;

    // Handlers, independent of httplib.
    [[nodiscard]] GatewayReply Health() const;
    [[nodiscard]] GatewayReply Capabilities(const std::string& key = "capabilities") const;
    [[nodiscard]] GatewayReply Invoke(const std::string& body);

    /// Install every route, the CORS policy and the JSON error handlers
    /// on `server`.
    void Mount(httplib::Server& server);

    /// Bind to options.host:options.port and serve until Stop().
    /// Fails with InternalTransportError when the port cannot be bound.
    [[nodiscard]] Result<void, Error> Listen();

    /// Stop a running Listen(). Safe to call from another thread.
    void Stop();

    [[nodiscard]] const GatewayOptions& Options() const noexcept { return options_; }

private:
    std::string NextCorrelationId();

    ProtocolDispatcher& dispatcher_;
    GatewayOptions options_;
    std::unique_ptr<httplib::Server> server_;
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

} // namespace toolbridge
