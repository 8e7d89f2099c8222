#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace op_mcp {

struct RetryConfig {
    int max_attempts = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
};

struct BackendConfig {
    std::string base_url;
    std::string api_key;
    std::optional<std::string> api_key_env; // env var name to read the key from
    int max_connections = 10;
    int connect_timeout_seconds = 10;
    int read_timeout_seconds = 30;
    int acquire_timeout_seconds = 30;
    RetryConfig retry;
};

enum class TransportKind {
    Stdio,
    Http,
    Sse,
};

std::optional<TransportKind> ParseTransportKind(const std::string& name);
std::string TransportKindName(TransportKind kind);

struct ServerConfig {
    TransportKind transport = TransportKind::Stdio;
    std::string host = "127.0.0.1";
    uint16_t port = 8000;
    int heartbeat_seconds = 30;
    std::string bearer_token;
    std::optional<std::string> bearer_token_env;
    bool strict_initialization = false;
};

struct AppConfig {
    BackendConfig backend;
    ServerConfig server;
    int tool_timeout_seconds = 60;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    bool json_logs = false;
    int verbosity = 0; // -v => 1, -vv => 2
    bool quiet = false;
};

// Values supplied by the environment or the command line. Unset fields keep
// whatever the lower-precedence layer had.
struct ConfigOverlay {
    std::optional<std::string> config_path;
    std::optional<std::string> base_url;
    std::optional<std::string> api_key;
    std::optional<std::string> api_key_env;
    std::optional<int> max_connections;
    std::optional<int> read_timeout_seconds;
    std::optional<int> tool_timeout_seconds;
    std::optional<TransportKind> transport;
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<std::string> bearer_token;
    std::optional<std::string> bearer_token_env;
    std::optional<bool> strict_initialization;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    std::optional<bool> json_logs;
    std::optional<int> verbosity;
    std::optional<bool> quiet;
    bool show_version = false;
};

} // namespace op_mcp
