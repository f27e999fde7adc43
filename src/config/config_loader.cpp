#include <toolbridge/config/config_loader.hpp>

#include <toolbridge/core/log.hpp>
#include <toolbridge/core/url.hpp>
#include <toolbridge/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <limits>

namespace toolbridge {

namespace {

Error MakeConfigError(const std::string& message,
                      std::optional<std::string> detail = std::nullopt) {
    return Error{"ConfigLoader", message, ErrorCode::MalformedRequest,
                 std::move(detail), {}};
}

Result<ServerMode, Error> ParseServerMode(const std::string& text) {
    if (text == "http") return Result<ServerMode, Error>::Ok(ServerMode::Http);
    if (text == "stdio") return Result<ServerMode, Error>::Ok(ServerMode::Stdio);
    return Result<ServerMode, Error>::Err(
        MakeConfigError("Invalid server mode '" + text + "' (expected http or stdio)"));
}

Result<uint16_t, Error> ToPort(int value) {
    if (value < 0 || value > std::numeric_limits<uint16_t>::max()) {
        return Result<uint16_t, Error>::Err(
            MakeConfigError("Port out of range: " + std::to_string(value)));
    }
    return Result<uint16_t, Error>::Ok(static_cast<uint16_t>(value));
}

template <typename T>
void ReadIfPresent(const YAML::Node& node, const char* key, T& target) {
    if (node[key]) {
        target = node[key].template as<T>();
    }
}

template <typename T>
void ReadIfPresent(const YAML::Node& node, const char* key, std::optional<T>& target) {
    if (node[key]) {
        target = node[key].template as<T>();
    }
}

std::optional<std::string> GetEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

} // anonymous namespace

const char* ServerModeName(ServerMode mode) {
    return mode == ServerMode::Stdio ? "stdio" : "http";
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    using R = Result<AppConfig, Error>;
    AppConfig config;

    try {
        const auto root = YAML::LoadFile(std::string(file_path));

        // -- Server --
        if (const auto server = root["server"]) {
            if (server["mode"]) {
                auto mode = ParseServerMode(server["mode"].as<std::string>());
                if (mode.IsErr()) return R::Err(mode.Error());
                config.server.mode = mode.Value();
            }
            ReadIfPresent(server, "host", config.server.host);
            if (server["port"]) {
                auto port = ToPort(server["port"].as<int>());
                if (port.IsErr()) return R::Err(port.Error());
                config.server.port = port.Value();
            }
            ReadIfPresent(server, "cors_origin", config.server.cors_origin);
            ReadIfPresent(server, "pipelined_stdio", config.server.pipelined_stdio);
        }

        // -- Timeouts --
        if (const auto timeouts = root["timeouts"]) {
            ReadIfPresent(timeouts, "init_ms", config.timeouts.init_ms);
            ReadIfPresent(timeouts, "execute_ms", config.timeouts.execute_ms);
        }

        // -- Logging --
        if (const auto logging = root["logging"]) {
            ReadIfPresent(logging, "level", config.logging.level);
            ReadIfPresent(logging, "json", config.logging.json);
            ReadIfPresent(logging, "file", config.logging.file);
        }

        // -- Context store --
        if (const auto store = root["context_store"]) {
            ReadIfPresent(store, "path", config.context_store_path);
        }

        // -- Providers --
        if (const auto providers = root["providers"]) {
            if (const auto sys = providers["system_info"]) {
                ReadIfPresent(sys, "enabled", config.providers.system_info.enabled);
                ReadIfPresent(sys, "cpu_sample_ms",
                              config.providers.system_info.cpu_sample_ms);
            }
            if (const auto http = providers["http_request"]) {
                ReadIfPresent(http, "enabled", config.providers.http_request.enabled);
                ReadIfPresent(http, "timeout_seconds",
                              config.providers.http_request.timeout_seconds);
            }
            if (const auto ha = providers["home_assistant"]) {
                auto& target = config.providers.home_assistant;
                ReadIfPresent(ha, "enabled", target.enabled);
                ReadIfPresent(ha, "url", target.url);
                ReadIfPresent(ha, "token", target.token);
                ReadIfPresent(ha, "token_env", target.token_env);
            }
        }
    } catch (const YAML::Exception& e) {
        return R::Err(MakeConfigError("Failed to parse YAML file: " +
                                      std::string(file_path), e.what()));
    }

    return R::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOverrides, Error> LoadFromCli(int argc, const char* const* argv) {
    using R = Result<CliOverrides, Error>;
    argparse::ArgumentParser program("toolbridge", kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "Tool-execution server: envelope protocol over stdio, REST gateway over HTTP.");

    int verbosity = 0;

    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--stdio")
        .help("Serve newline-delimited envelopes on stdin/stdout instead of HTTP")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--host")
        .help("HTTP listen address (default 0.0.0.0)");
    program.add_argument("--port")
        .help("HTTP listen port (default 8080)")
        .scan<'i', int>();
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("-v", "--verbose")
        .help("More logging (-v info, -vv debug)")
        .action([&verbosity](const std::string&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("-q", "--quiet")
        .help("Errors only")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--json-log")
        .help("Log as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Append JSON log lines to this file");
    program.add_argument("--context-store")
        .help("Record interactions as JSON lines in this file");
    program.add_argument("--execute-timeout-ms")
        .help("Upper bound for one capability execution")
        .scan<'i', int>();

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return R::Err(MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOverrides cli;
    cli.verbosity = verbosity;
    cli.show_version = program.get<bool>("--version");
    if (program.get<bool>("--stdio")) {
        cli.mode = ServerMode::Stdio;
    }
    if (auto val = program.present("--host")) {
        cli.host = *val;
    }
    if (auto val = program.present<int>("--port")) {
        auto port = ToPort(*val);
        if (port.IsErr()) return R::Err(port.Error());
        cli.port = port.Value();
    }
    if (auto val = program.present("--config")) {
        cli.config_path = *val;
    }
    if (auto val = program.present("--log-level")) {
        cli.log_level = *val;
    }
    cli.quiet = program.get<bool>("--quiet");
    cli.json_log = program.get<bool>("--json-log");
    if (auto val = program.present("--log-file")) {
        cli.log_file = *val;
    }
    if (auto val = program.present("--context-store")) {
        cli.context_store_path = *val;
    }
    if (auto val = program.present<int>("--execute-timeout-ms")) {
        cli.execute_timeout_ms = *val;
    }

    if (cli.quiet && cli.verbosity > 0) {
        return R::Err(MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return R::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const CliOverrides& cli) {
    AppConfig merged = base;

    if (cli.mode) merged.server.mode = *cli.mode;
    if (cli.host) merged.server.host = *cli.host;
    if (cli.port) merged.server.port = *cli.port;

    // Explicit level first, then the shorthand flags.
    if (cli.log_level) {
        merged.logging.level = *cli.log_level;
    } else if (cli.quiet) {
        merged.logging.level = "error";
    } else if (cli.verbosity >= 2) {
        merged.logging.level = "debug";
    } else if (cli.verbosity == 1) {
        merged.logging.level = "info";
    }
    if (cli.json_log) merged.logging.json = true;
    if (cli.log_file) merged.logging.file = cli.log_file;

    if (cli.context_store_path) merged.context_store_path = cli.context_store_path;
    if (cli.execute_timeout_ms) merged.timeouts.execute_ms = *cli.execute_timeout_ms;

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveEnvironment
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveEnvironment(AppConfig config) {
    auto& ha = config.providers.home_assistant;

    if (!ha.url) {
        ha.url = GetEnv("HOMEASSISTANT_URL").value_or(kDefaultHomeAssistantUrl);
    }

    if (ha.token.empty()) {
        if (ha.token_env) {
            auto value = GetEnv(*ha.token_env);
            if (!value && ha.enabled) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("Environment variable '" + *ha.token_env +
                                    "' not set (specified by token_env)"));
            }
            ha.token = value.value_or("");
        } else {
            ha.token = GetEnv("HOMEASSISTANT_TOKEN").value_or("");
        }
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    using R = Result<void, Error>;
    if (config.server.mode == ServerMode::Http) {
        if (config.server.port == 0) {
            return R::Err(MakeConfigError("Invalid port: 0"));
        }
        if (config.server.host.empty()) {
            return R::Err(MakeConfigError("Missing required field: server.host"));
        }
    }
    if (config.timeouts.init_ms <= 0) {
        return R::Err(MakeConfigError("timeouts.init_ms must be positive, got " +
                                      std::to_string(config.timeouts.init_ms)));
    }
    if (config.timeouts.execute_ms <= 0) {
        return R::Err(MakeConfigError("timeouts.execute_ms must be positive, got " +
                                      std::to_string(config.timeouts.execute_ms)));
    }
    if (!ParseLogLevel(config.logging.level)) {
        return R::Err(MakeConfigError("Unknown log level '" + config.logging.level + "'"));
    }
    if (config.context_store_path && config.context_store_path->empty()) {
        return R::Err(MakeConfigError("context_store.path must not be empty"));
    }

    const auto& sys = config.providers.system_info;
    if (sys.enabled && sys.cpu_sample_ms <= 0) {
        return R::Err(MakeConfigError("providers.system_info.cpu_sample_ms must be positive"));
    }
    const auto& http = config.providers.http_request;
    if (http.enabled && http.timeout_seconds <= 0) {
        return R::Err(MakeConfigError("providers.http_request.timeout_seconds must be positive"));
    }
    const auto& ha = config.providers.home_assistant;
    if (ha.enabled) {
        const auto url = ha.url.value_or(kDefaultHomeAssistantUrl);
        auto parsed = ParseHttpUrl(url);
        if (parsed.IsErr()) {
            return R::Err(MakeConfigError("Invalid providers.home_assistant.url '" + url + "'",
                                          parsed.Error()));
        }
    }
    return R::Ok();
}

} // namespace toolbridge
