#pragma once

#include <toolbridge/providers/http_transport.hpp>
#include <toolbridge/registry/i_capability_provider.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace toolbridge {

struct HomeAssistantOptions {
    std::string url = "http://localhost:8123";
    std::string token;  // long-lived access token; empty = not configured
    std::chrono::seconds timeout{10};
};

// ---------------------------------------------------------------------------
// HomeAssistantProvider: smart-home control through the Home Assistant
// REST API (bearer token auth).
//
//   home_assistant.get_states                         GET  /api/states
//   home_assistant.get_state     {entity_id}          GET  /api/states/<id>
//   home_assistant.call_service  {domain, service,    POST /api/services/<d>/<s>
//                                 service_data?}
//   home_assistant.get_services                       GET  /api/services
//
// Init fails on an unparseable URL. A missing token only fails the calls.
// ---------------------------------------------------------------------------
class HomeAssistantProvider : public ICapabilityProvider {
public:
    HomeAssistantProvider(HomeAssistantOptions options,
                          std::shared_ptr<IHttpTransport> transport);

    [[nodiscard]] std::string Name() const override { return "home_assistant"; }
    [[nodiscard]] std::vector<CapabilityDescriptor> Capabilities() const override;

    [[nodiscard]] Result<void, Error> Init() override;

    [[nodiscard]] Result<nlohmann::json, Error> Execute(
        const std::string& operation,
        const nlohmann::json& arguments) override;

private:
    Result<nlohmann::json, Error> Call(const std::string& method,
                                       const std::string& path,
                                       const nlohmann::json& body = nullptr) const;

    HomeAssistantOptions options_;
    std::shared_ptr<IHttpTransport> transport_;
    std::optional<HttpUrl> base_;  // set by Init()
};

} // namespace toolbridge
