#include <toolbridge/providers/http_request_provider.hpp>

#include <toolbridge/core/log.hpp>

#include <algorithm>
#include <cctype>

namespace toolbridge {

namespace {

Error RequestError(const std::string& message,
                   std::optional<std::string> detail = std::nullopt) {
    return Error{"HttpRequest", message, ErrorCode::ExecutionFailed, std::move(detail), {}};
}

std::string ToUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

} // anonymous namespace

HttpRequestProvider::HttpRequestProvider(std::shared_ptr<IHttpTransport> transport,
                                         HttpRequestOptions options)
    : transport_(std::move(transport)), options_(options) {}

std::vector<CapabilityDescriptor> HttpRequestProvider::Capabilities() const {
    return {{
        "request",
        "Make an HTTP request to a URL and return status, headers and body.",
        {
            {"type", "object"},
            {"properties", {
                {"method", {
                    {"type", "string"},
                    {"enum", {"GET", "POST", "PUT", "DELETE", "PATCH"}},
                    {"description", "HTTP method (default: GET)"}
                }},
                {"url", {
                    {"type", "string"},
                    {"minLength", 1},
                    {"description", "Absolute http:// or https:// URL"}
                }},
                {"headers", {
                    {"type", "object"},
                    {"additionalProperties", {{"type", "string"}}},
                    {"description", "Request headers"}
                }},
                {"body", {
                    {"type", "string"},
                    {"description", "Request body"}
                }},
                {"timeout_seconds", {
                    {"type", "integer"},
                    {"minimum", 1},
                    {"maximum", 300},
                    {"description", "Request timeout in seconds (default: 30)"}
                }}
            }},
            {"required", {"url"}},
            {"additionalProperties", false}
        }
    }};
}

Result<nlohmann::json, Error> HttpRequestProvider::Execute(
    const std::string& operation, const nlohmann::json& arguments) {
    using R = Result<nlohmann::json, Error>;
    if (operation != "request") {
        return R::Err(RequestError("unsupported operation '" + operation + "'"));
    }

    const auto url_text = arguments.value("url", std::string());
    auto url = ParseHttpUrl(url_text);
    if (url.IsErr()) {
        return R::Err(RequestError("invalid url '" + url_text + "'", url.Error()));
    }

    HttpCall call;
    call.method = ToUpper(arguments.value("method", std::string("GET")));
    call.url = url.Value();
    call.body = arguments.value("body", std::string());
    call.timeout = options_.default_timeout;
    if (auto t = arguments.find("timeout_seconds"); t != arguments.end() && t->is_number()) {
        call.timeout = std::chrono::seconds(t->get<int64_t>());
    }
    if (auto h = arguments.find("headers"); h != arguments.end() && h->is_object()) {
        for (auto it = h->begin(); it != h->end(); ++it) {
            if (!it.value().is_string()) continue;
            call.headers[it.key()] = it.value().get<std::string>();
        }
    }
    if (auto ct = call.headers.find("Content-Type"); ct != call.headers.end()) {
        call.content_type = ct->second;
        call.headers.erase(ct);
    } else if (call.body.empty()) {
        call.content_type.clear();
    }

    auto reply = transport_->Send(call);
    if (reply.IsErr()) {
        return R::Err(reply.Error());
    }
    const auto& r = reply.Value();
    LogInfo("http_request", call.method + " " + url_text + " -> " +
                                std::to_string(r.status));

    nlohmann::json headers = nlohmann::json::object();
    for (const auto& [key, value] : r.headers) {
        headers[key] = value;
    }
    return R::Ok({
        {"status", r.status},
        {"status_text", r.status_text},
        {"headers", std::move(headers)},
        {"body", r.body}
    });
}

} // namespace toolbridge
