#include <toolbridge/providers/http_transport.hpp>

#include <toolbridge/core/log.hpp>

#include <httplib.h>

#include <memory>

namespace toolbridge {

namespace {

Error TransportError(const std::string& message,
                     std::optional<std::string> detail = std::nullopt) {
    return Error{"HttpSend", message, ErrorCode::ExecutionFailed, std::move(detail), {}};
}

httplib::Headers ToHttplibHeaders(const HttpHeaders& headers) {
    httplib::Headers out;
    for (const auto& [key, value] : headers) {
        out.emplace(key, value);
    }
    return out;
}

HttpHeaders FromHttplibHeaders(const httplib::Headers& headers) {
    HttpHeaders out;
    for (const auto& [key, value] : headers) {
        // Repeated headers keep their first value.
        out.emplace(key, value);
    }
    return out;
}

} // anonymous namespace

Result<HttpReply, Error> HttplibTransport::Send(const HttpCall& call) {
    using R = Result<HttpReply, Error>;

    auto client = std::make_unique<httplib::Client>(call.url.Origin());
    client->set_connection_timeout(call.timeout);
    client->set_read_timeout(call.timeout);
    client->set_write_timeout(call.timeout);

    const auto headers = ToHttplibHeaders(call.headers);
    const auto& path = call.url.path;

    LogDebug("http", call.method + " " + call.url.Origin() + path);

    if (call.method != "GET" && call.method != "POST" && call.method != "PUT" &&
        call.method != "DELETE" && call.method != "PATCH") {
        return R::Err(TransportError("unsupported HTTP method '" + call.method + "'"));
    }

    auto perform = [&]() -> httplib::Result {
        if (call.method == "GET") {
            return client->Get(path, headers);
        }
        if (call.method == "POST") {
            return client->Post(path, headers, call.body, call.content_type);
        }
        if (call.method == "PUT") {
            return client->Put(path, headers, call.body, call.content_type);
        }
        if (call.method == "DELETE") {
            return client->Delete(path, headers, call.body, call.content_type);
        }
        return client->Patch(path, headers, call.body, call.content_type);
    };

    auto res = perform();
    if (!res) {
        return R::Err(TransportError(
            call.method + " " + call.url.Origin() + path + " failed",
            httplib::to_string(res.error())));
    }

    HttpReply reply;
    reply.status = res->status;
    reply.status_text = httplib::status_message(res->status);
    reply.headers = FromHttplibHeaders(res->headers);
    reply.body = res->body;
    LogDebug("http", "-> " + std::to_string(reply.status) + " (" +
                         std::to_string(reply.body.size()) + " bytes)");
    return R::Ok(std::move(reply));
}

} // namespace toolbridge
