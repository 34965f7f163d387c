#pragma once

#include <favorite_colors/core/log.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace favorite_colors {

enum class TransportKind {
    Stdio,
    Http,
    Https,
};

// Where the HTTP(S) listener binds. ":8080" means all interfaces.
struct ListenAddress {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;

    bool operator==(const ListenAddress& other) const {
        return host == other.host && port == other.port;
    }
    bool operator!=(const ListenAddress& other) const { return !(*this == other); }
};

struct LoggingConfig {
    LogLevel level = LogLevel::Warn;
    std::optional<std::string> log_file;
    bool json = false;
    bool force_color = false;
    bool force_no_color = false;
};

struct AppConfig {
    TransportKind transport = TransportKind::Stdio;
    ListenAddress listen;
    std::string cert_file;
    std::string key_file;
    LoggingConfig logging;
    std::optional<std::string> config_path;
};

[[nodiscard]] const char* TransportName(TransportKind kind);

} // namespace favorite_colors
