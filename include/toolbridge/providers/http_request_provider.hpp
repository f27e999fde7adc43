#pragma once

#include <toolbridge/providers/http_transport.hpp>
#include <toolbridge/registry/i_capability_provider.hpp>

#include <chrono>
#include <memory>

namespace toolbridge {

struct HttpRequestOptions {
    // Used when the caller passes no timeout_seconds.
    std::chrono::seconds default_timeout{30};
};

// ---------------------------------------------------------------------------
// HttpRequestProvider: "http_request.request": one outbound HTTP call.
//
// Arguments: url (required), method (GET/POST/PUT/DELETE/PATCH, default
// GET), headers (object of strings), body (string), timeout_seconds.
// Result:    {status, status_text, headers, body}
//
// Any HTTP status is a successful execution; only transport failures are
// errors.
// ---------------------------------------------------------------------------
class HttpRequestProvider : public ICapabilityProvider {
public:
    explicit HttpRequestProvider(std::shared_ptr<IHttpTransport> transport,
                                 HttpRequestOptions options = {});

    [[nodiscard]] std::string Name() const override { return "http_request"; }
    [[nodiscard]] std::vector<CapabilityDescriptor> Capabilities() const override;

    [[nodiscard]] Result<nlohmann::json, Error> Execute(
        const std::string& operation,
        const nlohmann::json& arguments) override;

private:
    std::shared_ptr<IHttpTransport> transport_;
    HttpRequestOptions options_;
};

} // namespace toolbridge
