#include <toolbridge/transport/http_gateway.hpp>

#include <toolbridge/core/log.hpp>
#include <toolbridge/core/version.hpp>

#include <httplib.h>

#include <exception>
#include <iomanip>
#include <sstream>

namespace toolbridge {

namespace {

std::string Dump(const nlohmann::json& j, int indent = -1) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

GatewayReply InvokeFailure(int status, int wire_code, const std::string& message,
                           const nlohmann::json& detail = nullptr) {
    nlohmann::json body = {
        {"success", false},
        {"result", nullptr},
        {"content", nlohmann::json::array()},
        {"error", message},
        {"error_code", wire_code}
    };
    if (!detail.is_null()) {
        body["error_detail"] = detail;
    }
    return {status, std::move(body)};
}

GatewayReply InvokeFailure(const Error& error) {
    return InvokeFailure(error.HttpStatus(), error.WireCode(), error.message,
                         error.detail ? nlohmann::json(*error.detail)
                                      : nlohmann::json(nullptr));
}

} // anonymous namespace

HttpGateway::HttpGateway(ProtocolDispatcher& dispatcher, GatewayOptions options)
    : dispatcher_(dispatcher),
      options_(std::move(options)),
      server_(std::make_unique<httplib::Server>()),
      rng_(std::random_device{}()) {
    Mount(*server_);
}

HttpGateway::~HttpGateway() = default;

// ---------------------------------------------------------------------------
// Handlers
// ---------------------------------------------------------------------------
GatewayReply HttpGateway::Health() const {
    return {200, {{"status", "healthy"}, {"version", kVersion}}};
}

GatewayReply HttpGateway::Capabilities(const std::string& key) const {
    try {
        auto described = DescribeCapabilities(dispatcher_.Registry().ListCapabilities());
        return {200, {{key, std::move(described["capabilities"])}}};
    } catch (const std::exception& e) {
        LogError("gateway", std::string("capability listing failed: ") + e.what());
        return {HttpStatusFor(ErrorCode::RegistryFault),
                {{"error", "capability listing failed"},
                 {"error_code", WireCode(ErrorCode::RegistryFault)}}};
    }
}

GatewayReply HttpGateway::Invoke(const std::string& body) {
    auto parsed = ParseJsonText(body);
    if (parsed.IsErr()) {
        return InvokeFailure(parsed.Error());
    }
    const auto& request_body = parsed.Value();

    const Error malformed{"Invoke", "body must be an object with a string 'tool_name'",
                          ErrorCode::MalformedRequest, std::nullopt, {}};
    if (!request_body.is_object()) {
        return InvokeFailure(malformed);
    }
    auto tool_name = request_body.find("tool_name");
    if (tool_name == request_body.end() || !tool_name->is_string() ||
        tool_name->get<std::string>().empty()) {
        return InvokeFailure(malformed);
    }

    RequestEnvelope request;
    request.id = NextCorrelationId();
    request.method = tool_name->get<std::string>();

    auto arguments = request_body.find("arguments");
    if (arguments != request_body.end() && !arguments->is_null()) {
        if (!arguments->is_object()) {
            return InvokeFailure(Error{"Invoke", "'arguments' must be an object",
                                       ErrorCode::InvalidArguments, std::nullopt, {}});
        }
        request.params = *arguments;
    }

    LogDebug("gateway", "invoke " + request.method + " as id=" +
                            request.id.get<std::string>());
    auto response = dispatcher_.Dispatch(request);

    if (response.IsSuccess()) {
        const auto& result = response.ResultPayload();
        return {200,
                {{"success", true},
                 {"result", result},
                 {"content", nlohmann::json::array(
                                 {{{"type", "text"}, {"text", Dump(result, 2)}}})},
                 {"error", nullptr}}};
    }

    const auto& error = response.ErrorPayload();
    const auto code = ErrorCodeFromWire(error.code);
    const int status = code ? HttpStatusFor(*code) : 500;
    nlohmann::json detail = nullptr;
    if (error.data.is_object() && error.data.contains("detail")) {
        detail = error.data["detail"];
    }
    return InvokeFailure(status, error.code, error.message, detail);
}

std::string HttpGateway::NextCorrelationId() {
    uint64_t value = 0;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        value = rng_();
    }
    std::ostringstream oss;
    oss << "gw-" << std::hex << std::setw(16) << std::setfill('0') << value;
    return oss.str();
}

// ---------------------------------------------------------------------------
// httplib wiring
// ---------------------------------------------------------------------------
void HttpGateway::Mount(httplib::Server& server) {
    const auto cors_origin = options_.cors_origin;
    auto write = [cors_origin](httplib::Response& res, const GatewayReply& reply) {
        res.status = reply.status;
        res.set_content(Dump(reply.body), "application/json");
        if (!cors_origin.empty()) {
            res.set_header("Access-Control-Allow-Origin", cors_origin);
        }
    };

    server.Get("/health", [this, write](const httplib::Request&, httplib::Response& res) {
        write(res, Health());
    });
    server.Get("/capabilities", [this, write](const httplib::Request&, httplib::Response& res) {
        write(res, Capabilities("capabilities"));
    });
    server.Get("/tools", [this, write](const httplib::Request&, httplib::Response& res) {
        write(res, Capabilities("tools"));
    });
    server.Post("/invoke", [this, write](const httplib::Request& req, httplib::Response& res) {
        write(res, Invoke(req.body));
    });
    server.Post("/tools/call", [this, write](const httplib::Request& req, httplib::Response& res) {
        write(res, Invoke(req.body));
    });

    server.Options(R"(.*)", [cors_origin](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
        if (!cors_origin.empty()) {
            res.set_header("Access-Control-Allow-Origin", cors_origin);
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
            res.set_header("Access-Control-Max-Age", "86400");
        }
    });

    server.set_exception_handler(
        [write](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string message = "unknown exception";
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    message = e.what();
                } catch (...) {
                    message = "non-standard exception";
                }
            }
            LogError("gateway", req.method + " " + req.path + " failed: " + message);
            write(res, {500,
                        {{"success", false},
                         {"error", message},
                         {"error_code", WireCode(ErrorCode::InternalTransportError)}}});
        });

    server.set_error_handler([write](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) return;
        const auto status = res.status;
        const std::string message =
            status == 404 ? "no route for " + req.method + " " + req.path
                          : "request failed with status " + std::to_string(status);
        write(res, {status, {{"success", false}, {"error", message}}});
    });
}

Result<void, Error> HttpGateway::Listen() {
    if (!server_->bind_to_port(options_.host, options_.port)) {
        return Result<void, Error>::Err(Error{
            "Listen", "cannot bind " + options_.host + ":" + std::to_string(options_.port),
            ErrorCode::InternalTransportError, std::nullopt, {}});
    }
    LogInfo("gateway", "listening on http://" + options_.host + ":" +
                           std::to_string(options_.port));
    if (!server_->listen_after_bind()) {
        return Result<void, Error>::Err(Error{
            "Listen", "listener stopped unexpectedly",
            ErrorCode::InternalTransportError, std::nullopt, {}});
    }
    LogInfo("gateway", "listener stopped");
    return Result<void, Error>::Ok();
}

void HttpGateway::Stop() {
    server_->stop();
}

} // namespace toolbridge
