#pragma once

#include <favorite_colors/config/app_config.hpp>
#include <favorite_colors/core/result.hpp>

#include <string>
#include <string_view>

namespace favorite_colors {

// "stdio", "http" or "https".
Result<TransportKind, Error> ParseTransport(std::string_view text);

// ":8080", "8080", "127.0.0.1:9000" or "localhost:9000".
Result<ListenAddress, Error> ParseListenAddress(std::string_view text);

// "debug", "info", "warn" or "error".
Result<LogLevel, Error> ParseLogLevel(std::string_view text);

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig. -h/--help prints usage and exits.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: values in cli_overrides that differ from the defaults
// replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// HTTPS needs a readable certificate and key; other transports need nothing.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace favorite_colors
