#pragma once

#include <toolbridge/config/app_config.hpp>
#include <toolbridge/core/result.hpp>

#include <string>
#include <string_view>

namespace toolbridge {

constexpr const char* kDefaultHomeAssistantUrl = "http://localhost:8123";

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments.
Result<CliOverrides, Error> LoadFromCli(int argc, const char* const* argv);

// Apply cli on top of base. Set fields in cli win.
AppConfig MergeConfigs(const AppConfig& base, const CliOverrides& cli);

// Fill the Home Assistant URL and token from the environment:
//   url:   HOMEASSISTANT_URL when no URL is configured, else the default
//   token: the variable named by token_env, else HOMEASSISTANT_TOKEN,
//          when no token is configured
// Fails if token_env names a variable that is not set.
Result<AppConfig, Error> ResolveEnvironment(AppConfig config);

// Validate that values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// "stdio" / "http".
const char* ServerModeName(ServerMode mode);

} // namespace toolbridge
