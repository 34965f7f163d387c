#include <favorite_colors/config/config_loader.hpp>
#include <favorite_colors/core/log.hpp>
#include <favorite_colors/core/terminal.hpp>
#include <favorite_colors/core/version.hpp>
#include <favorite_colors/http/http_transport.hpp>
#include <favorite_colors/mcp/color_tools.hpp>
#include <favorite_colors/mcp/mcp_server.hpp>
#include <favorite_colors/store/color_store.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

constexpr int kExitSuccess = 0;

volatile std::sig_atomic_t g_shutdown_requested = 0;

void HandleShutdownSignal(int /*signal*/) {
    g_shutdown_requested = 1;
}

// --version is answered before argparse runs so it works next to any flags.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--version") {
            std::cout << favorite_colors::kServerName << " "
                      << favorite_colors::kVersion << "\n";
            return true;
        }
    }
    return false;
}

void PrintError(const favorite_colors::Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

std::unique_ptr<favorite_colors::ILogSink> MakeLogSink(
    const favorite_colors::LoggingConfig& logging) {
    using namespace favorite_colors;

    if (logging.log_file) {
        auto sink = std::make_unique<FileSink>(*logging.log_file);
        if (sink->IsOpen()) {
            return sink;
        }
        std::cerr << "Warning: cannot open log file '" << *logging.log_file
                  << "', logging to stderr\n";
    }
    if (logging.json) {
        return std::make_unique<JsonSink>(std::cerr);
    }
    return std::make_unique<ColorConsoleSink>(
        ResolveLogColor(logging.force_color, logging.force_no_color));
}

int RunHttp(const favorite_colors::McpServer& server,
            const favorite_colors::AppConfig& config) {
    using namespace favorite_colors;

    std::signal(SIGINT, HandleShutdownSignal);
    std::signal(SIGTERM, HandleShutdownSignal);

    HttpTransportOptions options;
    options.listen = config.listen;
    options.use_https = config.transport == TransportKind::Https;
    options.cert_file = config.cert_file;
    options.key_file = config.key_file;

    HttpTransport transport(server, options);
    auto result = transport.Run([] { return g_shutdown_requested != 0; });
    if (result.IsErr()) {
        LogError("main", result.Error().ToString());
        PrintError(result.Error());
        return result.Error().ExitCode();
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace favorite_colors;

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    // CLI parsing (argparse handles --help and exits).
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error());
        return cli_result.Error().ExitCode();
    }
    auto config = std::move(cli_result).Value();

    if (config.config_path) {
        auto yaml_result = LoadFromYaml(*config.config_path);
        if (yaml_result.IsErr()) {
            PrintError(yaml_result.Error());
            return yaml_result.Error().ExitCode();
        }
        config = MergeConfigs(yaml_result.Value(), config);
    }

    InitGlobalLogger(MakeLogSink(config.logging), config.logging.level);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        LogError("main", valid.Error().ToString());
        PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    LogDebug("main", std::string("transport=") + TransportName(config.transport));

    // One store per process, shared by every tool handler.
    ColorStore store;
    ToolRegistry registry;
    RegisterColorTools(registry, store);
    McpServer server(std::move(registry));

    if (config.transport == TransportKind::Stdio) {
        server.Run();
        return kExitSuccess;
    }
    return RunHttp(server, config);
}
