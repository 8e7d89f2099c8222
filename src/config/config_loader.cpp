#include <op_mcp/config/config_loader.hpp>

#include <op_mcp/core/log.hpp>
#include <op_mcp/core/types.hpp>
#include <op_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace op_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Make(ErrorCategory::Config, "ConfigLoader", message);
}

template <typename T>
void ReadIf(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

template <typename T>
void ReadIf(const YAML::Node& node, const char* key, std::optional<T>& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

Result<int, Error> ParseIntValue(const std::string& name, const std::string& text) {
    try {
        size_t used = 0;
        int v = std::stoi(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
        return Result<int, Error>::Ok(v);
    } catch (const std::exception&) {
        return Result<int, Error>::Err(
            MakeConfigError(name + " must be an integer, got '" + text + "'"));
    }
}

} // anonymous namespace

std::optional<TransportKind> ParseTransportKind(const std::string& name) {
    if (name == "stdio") return TransportKind::Stdio;
    if (name == "http") return TransportKind::Http;
    if (name == "sse") return TransportKind::Sse;
    return std::nullopt;
}

std::string TransportKindName(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http:  return "http";
        case TransportKind::Sse:   return "sse";
    }
    return "stdio";
}

EnvLookup ProcessEnv() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (v == nullptr) return std::nullopt;
        return std::string(v);
    };
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    try {
        const YAML::Node root = YAML::LoadFile(std::string(file_path));

        // -- Backend --
        if (const auto backend = root["backend"]) {
            ReadIf(backend, "base_url", config.backend.base_url);
            ReadIf(backend, "api_key", config.backend.api_key);
            ReadIf(backend, "api_key_env", config.backend.api_key_env);
            ReadIf(backend, "max_connections", config.backend.max_connections);
            if (const auto timeouts = backend["timeouts"]) {
                ReadIf(timeouts, "connect", config.backend.connect_timeout_seconds);
                ReadIf(timeouts, "read", config.backend.read_timeout_seconds);
                ReadIf(timeouts, "acquire", config.backend.acquire_timeout_seconds);
            }
            if (const auto retry = backend["retry"]) {
                ReadIf(retry, "max_attempts", config.backend.retry.max_attempts);
                if (retry["base_delay_ms"]) {
                    config.backend.retry.base_delay =
                        std::chrono::milliseconds(retry["base_delay_ms"].as<int>());
                }
                if (retry["max_delay_ms"]) {
                    config.backend.retry.max_delay =
                        std::chrono::milliseconds(retry["max_delay_ms"].as<int>());
                }
            }
        }

        // -- Server --
        if (const auto server = root["server"]) {
            if (server["transport"]) {
                auto name = server["transport"].as<std::string>();
                auto kind = ParseTransportKind(name);
                if (!kind.has_value()) {
                    return Result<AppConfig, Error>::Err(
                        MakeConfigError("Unknown transport '" + name +
                                        "' (expected stdio, http or sse)"));
                }
                config.server.transport = *kind;
            }
            ReadIf(server, "host", config.server.host);
            ReadIf(server, "port", config.server.port);
            ReadIf(server, "heartbeat_seconds", config.server.heartbeat_seconds);
            ReadIf(server, "bearer_token", config.server.bearer_token);
            ReadIf(server, "bearer_token_env", config.server.bearer_token_env);
            ReadIf(server, "strict_initialization", config.server.strict_initialization);
        }

        // -- Options --
        ReadIf(root, "tool_timeout", config.tool_timeout_seconds);
        ReadIf(root, "log_level", config.log_level);
        ReadIf(root, "log_file", config.log_file);
        ReadIf(root, "json_logs", config.json_logs);
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromEnv
// ---------------------------------------------------------------------------
Result<ConfigOverlay, Error> LoadFromEnv(const EnvLookup& env) {
    ConfigOverlay overlay;

    overlay.base_url = env("OPENPROJECT_BASE_URL");
    overlay.api_key = env("OPENPROJECT_API_KEY");
    overlay.host = env("MCP_HOST");
    overlay.log_level = env("LOG_LEVEL");
    overlay.bearer_token = env("MCP_BEARER_TOKEN");

    if (auto mode = env("MCP_MODE")) {
        auto kind = ParseTransportKind(*mode);
        if (!kind.has_value()) {
            return Result<ConfigOverlay, Error>::Err(
                MakeConfigError("MCP_MODE must be stdio, http or sse, got '" +
                                *mode + "'"));
        }
        overlay.transport = kind;
    }

    const std::pair<const char*, std::optional<int>*> ints[] = {
        {"MCP_PORT", &overlay.port},
        {"MAX_CONNECTIONS", &overlay.max_connections},
        {"TIMEOUT", &overlay.read_timeout_seconds},
    };
    for (const auto& [name, target] : ints) {
        if (auto raw = env(name)) {
            auto parsed = ParseIntValue(name, *raw);
            if (parsed.IsErr()) {
                return Result<ConfigOverlay, Error>::Err(parsed.Error());
            }
            *target = parsed.Value();
        }
    }

    return Result<ConfigOverlay, Error>::Ok(std::move(overlay));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<ConfigOverlay, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program(kServerName, kVersion,
                                     argparse::default_arguments::help);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--transport")
        .help("Transport: stdio, http or sse");
    program.add_argument("--host")
        .help("Listen address for http/sse");
    program.add_argument("--port")
        .help("Listen port for http/sse")
        .scan<'i', int>();
    program.add_argument("--base-url")
        .help("OpenProject API root, e.g. https://op.example.com/api/v3");
    program.add_argument("--api-key-env")
        .help("Environment variable containing the OpenProject API key");
    program.add_argument("--max-connections")
        .help("Maximum concurrent backend requests")
        .scan<'i', int>();
    program.add_argument("--timeout")
        .help("Backend read timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--tool-timeout")
        .help("Per-tool call timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--bearer-token-env")
        .help("Environment variable containing the bearer token clients must send");
    program.add_argument("--strict-init")
        .help("Reject requests before initialize")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--json-logs")
        .help("Emit logs as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Only log errors")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    int verbosity = 0;
    program.add_argument("-v", "--verbose")
        .help("Verbose logging (-vv for debug)")
        .action([&](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<ConfigOverlay, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    ConfigOverlay overlay;
    overlay.config_path = program.present("--config");
    overlay.host = program.present("--host");
    overlay.port = program.present<int>("--port");
    overlay.base_url = program.present("--base-url");
    overlay.api_key_env = program.present("--api-key-env");
    overlay.max_connections = program.present<int>("--max-connections");
    overlay.read_timeout_seconds = program.present<int>("--timeout");
    overlay.tool_timeout_seconds = program.present<int>("--tool-timeout");
    overlay.bearer_token_env = program.present("--bearer-token-env");
    overlay.log_file = program.present("--log-file");
    overlay.log_level = program.present("--log-level");

    if (auto name = program.present("--transport")) {
        auto kind = ParseTransportKind(*name);
        if (!kind.has_value()) {
            return Result<ConfigOverlay, Error>::Err(
                MakeConfigError("--transport must be stdio, http or sse, got '" +
                                *name + "'"));
        }
        overlay.transport = kind;
    }
    if (program.get<bool>("--strict-init")) {
        overlay.strict_initialization = true;
    }
    if (program.get<bool>("--json-logs")) {
        overlay.json_logs = true;
    }
    if (program.get<bool>("--quiet")) {
        overlay.quiet = true;
    }
    if (verbosity > 0) {
        overlay.verbosity = verbosity;
    }
    overlay.show_version = program.get<bool>("--version");

    return Result<ConfigOverlay, Error>::Ok(std::move(overlay));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const ConfigOverlay& overlay) {
    AppConfig merged = base;

    if (overlay.base_url) merged.backend.base_url = *overlay.base_url;
    if (overlay.api_key) merged.backend.api_key = *overlay.api_key;
    if (overlay.api_key_env) merged.backend.api_key_env = overlay.api_key_env;
    if (overlay.max_connections) merged.backend.max_connections = *overlay.max_connections;
    if (overlay.read_timeout_seconds) {
        merged.backend.read_timeout_seconds = *overlay.read_timeout_seconds;
    }

    if (overlay.transport) merged.server.transport = *overlay.transport;
    if (overlay.host) merged.server.host = *overlay.host;
    if (overlay.port) {
        // Out-of-range values are caught by ValidateConfig via port == 0.
        merged.server.port = (*overlay.port >= 1 && *overlay.port <= 65535)
            ? static_cast<uint16_t>(*overlay.port) : 0;
    }
    if (overlay.bearer_token) merged.server.bearer_token = *overlay.bearer_token;
    if (overlay.bearer_token_env) merged.server.bearer_token_env = overlay.bearer_token_env;
    if (overlay.strict_initialization) {
        merged.server.strict_initialization = *overlay.strict_initialization;
    }

    if (overlay.tool_timeout_seconds) merged.tool_timeout_seconds = *overlay.tool_timeout_seconds;
    if (overlay.log_level) merged.log_level = overlay.log_level;
    if (overlay.log_file) merged.log_file = overlay.log_file;
    if (overlay.json_logs) merged.json_logs = *overlay.json_logs;
    if (overlay.verbosity) merged.verbosity = *overlay.verbosity;
    if (overlay.quiet) merged.quiet = *overlay.quiet;

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveSecrets
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveSecrets(AppConfig config, const EnvLookup& env) {
    if (config.backend.api_key.empty() && config.backend.api_key_env.has_value()) {
        const auto& var = *config.backend.api_key_env;
        auto value = env(var);
        if (!value.has_value()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Environment variable '" + var +
                                "' not set (specified by api_key_env)"));
        }
        config.backend.api_key = *value;
    }
    if (config.server.bearer_token.empty() && config.server.bearer_token_env.has_value()) {
        const auto& var = *config.server.bearer_token_env;
        auto value = env(var);
        if (!value.has_value()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Environment variable '" + var +
                                "' not set (specified by bearer_token_env)"));
        }
        config.server.bearer_token = *value;
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    const auto fail = [](const std::string& message) {
        return Result<void, Error>::Err(MakeConfigError(message));
    };

    if (config.backend.base_url.empty()) {
        return fail("Missing required field: base_url (OPENPROJECT_BASE_URL)");
    }
    auto url = BaseUrl::Create(config.backend.base_url);
    if (url.IsErr()) {
        return fail("Invalid base_url: " + url.Error());
    }
    if (config.backend.api_key.empty()) {
        return fail("Missing required field: api_key (OPENPROJECT_API_KEY)");
    }
    if (config.backend.max_connections < 1) {
        return fail("max_connections must be at least 1, got " +
                    std::to_string(config.backend.max_connections));
    }
    if (config.backend.connect_timeout_seconds <= 0 ||
        config.backend.read_timeout_seconds <= 0 ||
        config.backend.acquire_timeout_seconds <= 0) {
        return fail("Backend timeouts must be positive");
    }
    if (config.tool_timeout_seconds <= 0) {
        return fail("Tool timeout must be positive, got " +
                    std::to_string(config.tool_timeout_seconds));
    }
    const auto& retry = config.backend.retry;
    if (retry.max_attempts < 1) {
        return fail("retry.max_attempts must be at least 1");
    }
    if (retry.base_delay.count() < 0 || retry.base_delay > retry.max_delay) {
        return fail("retry.base_delay_ms must be between 0 and retry.max_delay_ms");
    }
    if (config.server.transport != TransportKind::Stdio) {
        if (config.server.port == 0) {
            return fail("Invalid port: must be in 1..65535");
        }
        if (config.server.host.empty()) {
            return fail("Missing required field: host");
        }
        if (config.server.heartbeat_seconds <= 0) {
            return fail("heartbeat_seconds must be positive");
        }
    }
    if (config.log_level.has_value() && !ParseLogLevel(*config.log_level).has_value()) {
        return fail("Unknown log level '" + *config.log_level + "'");
    }
    if (config.verbosity > 0 && config.quiet) {
        return fail("Cannot use both --verbose and --quiet");
    }
    return Result<void, Error>::Ok();
}

} // namespace op_mcp
