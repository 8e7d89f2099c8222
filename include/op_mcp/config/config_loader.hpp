#pragma once

#include <op_mcp/config/app_config.hpp>
#include <op_mcp/core/result.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace op_mcp {

// Looks up an environment variable. Injected so tests need not touch the
// process environment.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// std::getenv-backed lookup.
EnvLookup ProcessEnv();

// Parse a YAML config file on top of the built-in defaults.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Read OPENPROJECT_BASE_URL, OPENPROJECT_API_KEY, MCP_MODE, MCP_HOST,
// MCP_PORT, MAX_CONNECTIONS, TIMEOUT, LOG_LEVEL and MCP_BEARER_TOKEN.
Result<ConfigOverlay, Error> LoadFromEnv(const EnvLookup& env);

// Parse CLI arguments. --version sets show_version; --help is printed by
// argparse itself.
Result<ConfigOverlay, Error> LoadFromCli(int argc, const char* const* argv);

// Apply every field set in `overlay` on top of `base`.
AppConfig MergeConfigs(const AppConfig& base, const ConfigOverlay& overlay);

// Fill api_key / bearer_token from the variables named by api_key_env /
// bearer_token_env when the literal value is empty.
Result<AppConfig, Error> ResolveSecrets(AppConfig config, const EnvLookup& env);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace op_mcp
