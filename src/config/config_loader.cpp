#include <favorite_colors/config/config_loader.hpp>

#include <favorite_colors/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace favorite_colors {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, ErrorCategory::Config};
}

std::string ToLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool IsAllDigits(std::string_view text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

constexpr const char* kEpilog =
    "Examples:\n"
    "  favorite-colors-mcp                                   # stdio transport (desktop clients)\n"
    "  favorite-colors-mcp --transport http                  # HTTP transport (MCP Inspector)\n"
    "  favorite-colors-mcp --transport https --cert certificates/server.crt --key certificates/server.key\n"
    "  favorite-colors-mcp --transport http --port :9000     # HTTP on a custom port\n"
    "\n"
    "Available tools: add_color, get_colors, remove_color, clear_colors";

} // anonymous namespace

const char* TransportName(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http:  return "http";
        case TransportKind::Https: return "https";
    }
    return "stdio";
}

// ---------------------------------------------------------------------------
// Scalar parsers
// ---------------------------------------------------------------------------
Result<TransportKind, Error> ParseTransport(std::string_view text) {
    using R = Result<TransportKind, Error>;
    if (text == "stdio") return R::Ok(TransportKind::Stdio);
    if (text == "http")  return R::Ok(TransportKind::Http);
    if (text == "https") return R::Ok(TransportKind::Https);
    return R::Err(MakeConfigError("Invalid transport: " + std::string(text) +
                                  ". Use 'stdio', 'http', or 'https'"));
}

Result<ListenAddress, Error> ParseListenAddress(std::string_view text) {
    using R = Result<ListenAddress, Error>;

    ListenAddress address;
    std::string_view port_text = text;

    auto colon = text.rfind(':');
    if (colon != std::string_view::npos) {
        auto host = text.substr(0, colon);
        if (!host.empty()) {
            address.host = std::string(host);
        }
        port_text = text.substr(colon + 1);
    }

    if (!IsAllDigits(port_text) || port_text.size() > 5) {
        return R::Err(MakeConfigError("Invalid port: '" + std::string(text) + "'"));
    }
    auto port = std::stoi(std::string(port_text));
    if (port < 1 || port > 65535) {
        return R::Err(MakeConfigError("Port out of range: " + std::string(port_text)));
    }
    address.port = static_cast<uint16_t>(port);
    return R::Ok(std::move(address));
}

Result<LogLevel, Error> ParseLogLevel(std::string_view text) {
    using R = Result<LogLevel, Error>;
    auto lower = ToLower(text);
    if (lower == "debug") return R::Ok(LogLevel::Debug);
    if (lower == "info")  return R::Ok(LogLevel::Info);
    if (lower == "warn" || lower == "warning") return R::Ok(LogLevel::Warn);
    if (lower == "error") return R::Ok(LogLevel::Error);
    return R::Err(MakeConfigError("Invalid log level: " + std::string(text)));
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    using R = Result<AppConfig, Error>;

    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return R::Err(MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    config.config_path = std::string(file_path);

    try {
        if (root["transport"]) {
            auto transport = ParseTransport(root["transport"].as<std::string>());
            if (transport.IsErr()) {
                return R::Err(transport.Error());
            }
            config.transport = transport.Value();
        }
        if (root["port"]) {
            auto listen = ParseListenAddress(root["port"].as<std::string>());
            if (listen.IsErr()) {
                return R::Err(listen.Error());
            }
            config.listen = listen.Value();
        }
        if (root["cert"]) {
            config.cert_file = root["cert"].as<std::string>();
        }
        if (root["key"]) {
            config.key_file = root["key"].as<std::string>();
        }

        // -- Logging --
        if (root["log_level"]) {
            auto level = ParseLogLevel(root["log_level"].as<std::string>());
            if (level.IsErr()) {
                return R::Err(level.Error());
            }
            config.logging.level = level.Value();
        }
        if (root["log_file"]) {
            config.logging.log_file = root["log_file"].as<std::string>();
        }
        if (root["log_json"]) {
            config.logging.json = root["log_json"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return R::Err(MakeConfigError("Invalid value in YAML file: " + std::string(e.what())));
    }

    return R::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    using R = Result<AppConfig, Error>;

    argparse::ArgumentParser program(kServerName, kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "A Model Context Protocol server for managing favorite colors.");
    program.add_epilog(kEpilog);

    program.add_argument("--transport")
        .help("Transport type: stdio, http, or https")
        .default_value(std::string("stdio"));
    program.add_argument("--port")
        .help("Listen address for HTTP/HTTPS transport (e.g. :8080)")
        .default_value(std::string(":8080"));
    program.add_argument("--cert")
        .help("TLS certificate file (required for https transport)");
    program.add_argument("--key")
        .help("TLS private key file (required for https transport)");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--log-file")
        .help("Append log output to this file");
    program.add_argument("--log-json")
        .help("Log as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Info-level logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-vv")
        .help("Debug-level logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return R::Err(MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    auto transport = ParseTransport(program.get<std::string>("--transport"));
    if (transport.IsErr()) {
        return R::Err(transport.Error());
    }
    config.transport = transport.Value();

    auto listen = ParseListenAddress(program.get<std::string>("--port"));
    if (listen.IsErr()) {
        return R::Err(listen.Error());
    }
    config.listen = listen.Value();

    if (auto val = program.present("--cert")) {
        config.cert_file = *val;
    }
    if (auto val = program.present("--key")) {
        config.key_file = *val;
    }
    if (auto val = program.present("--config")) {
        config.config_path = *val;
    }

    // Logging
    if (program.get<bool>("-vv")) {
        config.logging.level = LogLevel::Debug;
    } else if (program.get<bool>("--verbose")) {
        config.logging.level = LogLevel::Info;
    }
    if (auto val = program.present("--log-file")) {
        config.logging.log_file = *val;
    }
    config.logging.json = program.get<bool>("--log-json");
    config.logging.force_color = program.get<bool>("--color");
    config.logging.force_no_color = program.get<bool>("--no-color");

    return R::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    const AppConfig defaults;
    AppConfig merged = yaml_base;

    if (cli_overrides.transport != defaults.transport) {
        merged.transport = cli_overrides.transport;
    }
    if (cli_overrides.listen != defaults.listen) {
        merged.listen = cli_overrides.listen;
    }
    if (!cli_overrides.cert_file.empty()) {
        merged.cert_file = cli_overrides.cert_file;
    }
    if (!cli_overrides.key_file.empty()) {
        merged.key_file = cli_overrides.key_file;
    }
    if (cli_overrides.config_path) {
        merged.config_path = cli_overrides.config_path;
    }

    // Logging overrides
    if (cli_overrides.logging.level != defaults.logging.level) {
        merged.logging.level = cli_overrides.logging.level;
    }
    if (cli_overrides.logging.log_file) {
        merged.logging.log_file = cli_overrides.logging.log_file;
    }
    if (cli_overrides.logging.json) {
        merged.logging.json = true;
    }
    merged.logging.force_color = cli_overrides.logging.force_color;
    merged.logging.force_no_color = cli_overrides.logging.force_no_color;

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    using R = Result<void, Error>;

    if (config.transport != TransportKind::Https) {
        return R::Ok();
    }

    if (config.cert_file.empty() || config.key_file.empty()) {
        return R::Err(MakeConfigError(
            "HTTPS transport requires both --cert and --key flags"));
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(config.cert_file, ec)) {
        return R::Err(Error{"ConfigLoader",
                            "TLS certificate not found: " + config.cert_file,
                            ErrorCategory::Tls});
    }
    if (!std::filesystem::is_regular_file(config.key_file, ec)) {
        return R::Err(Error{"ConfigLoader",
                            "TLS private key not found: " + config.key_file,
                            ErrorCategory::Tls});
    }

    return R::Ok();
}

} // namespace favorite_colors
