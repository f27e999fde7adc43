#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace toolbridge {

enum class ServerMode {
    Http,
    Stdio,
};

struct ServerConfig {
    ServerMode mode = ServerMode::Http;
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    std::string cors_origin = "*";  // empty disables CORS headers
    bool pipelined_stdio = false;
};

struct TimeoutConfig {
    int init_ms = 5000;
    int execute_ms = 30000;
};

struct LoggingConfig {
    std::string level = "info";
    bool json = false;
    std::optional<std::string> file;
};

struct SystemInfoConfig {
    bool enabled = true;
    int cpu_sample_ms = 200;
};

struct HttpRequestConfig {
    bool enabled = true;
    int timeout_seconds = 30;
};

struct HomeAssistantConfig {
    bool enabled = true;
    std::optional<std::string> url;        // falls back to HOMEASSISTANT_URL
    std::string token;
    std::optional<std::string> token_env;  // env var name to read token from
};

struct ProvidersConfig {
    SystemInfoConfig system_info;
    HttpRequestConfig http_request;
    HomeAssistantConfig home_assistant;
};

struct AppConfig {
    ServerConfig server;
    TimeoutConfig timeouts;
    LoggingConfig logging;
    std::optional<std::string> context_store_path;
    ProvidersConfig providers;
};

// Settings given on the command line. Unset fields leave the YAML (or
// default) value alone.
struct CliOverrides {
    std::optional<std::string> config_path;
    std::optional<ServerMode> mode;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<std::string> log_level;
    int verbosity = 0;  // number of -v flags
    bool quiet = false;
    bool json_log = false;
    std::optional<std::string> log_file;
    std::optional<std::string> context_store_path;
    std::optional<int> execute_timeout_ms;
    bool show_version = false;
};

} // namespace toolbridge
