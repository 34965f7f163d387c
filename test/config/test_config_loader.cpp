#include <catch2/catch_test_macros.hpp>

#include <favorite_colors/config/config_loader.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace favorite_colors;

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests run from the build directory, so derive the source tree from __FILE__.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

Result<AppConfig, Error> ParseArgs(std::vector<const char*> args) {
    args.insert(args.begin(), "favorite-colors-mcp");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

// Creates an empty file and removes it again at scope exit.
class TempFile {
public:
    explicit TempFile(const std::string& name)
        : path_((std::filesystem::temp_directory_path() / name).string()) {
        std::ofstream(path_) << "placeholder\n";
    }
    ~TempFile() { std::remove(path_.c_str()); }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    [[nodiscard]] const std::string& Path() const { return path_; }

private:
    std::string path_;
};

} // anonymous namespace

// ===========================================================================
// Scalar parsers
// ===========================================================================

TEST_CASE("ParseTransport: accepts the three transports", "[config]") {
    CHECK(ParseTransport("stdio").Value() == TransportKind::Stdio);
    CHECK(ParseTransport("http").Value() == TransportKind::Http);
    CHECK(ParseTransport("https").Value() == TransportKind::Https);
}

TEST_CASE("ParseTransport: rejects anything else", "[config]") {
    auto result = ParseTransport("HTTP");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().message ==
          "Invalid transport: HTTP. Use 'stdio', 'http', or 'https'");
}

TEST_CASE("ParseListenAddress: port forms", "[config]") {
    SECTION(":port binds all interfaces") {
        auto r = ParseListenAddress(":9000");
        REQUIRE(r.IsOk());
        CHECK(r.Value().host == "0.0.0.0");
        CHECK(r.Value().port == 9000);
    }
    SECTION("bare port") {
        auto r = ParseListenAddress("8081");
        REQUIRE(r.IsOk());
        CHECK(r.Value().port == 8081);
    }
    SECTION("host and port") {
        auto r = ParseListenAddress("127.0.0.1:9443");
        REQUIRE(r.IsOk());
        CHECK(r.Value().host == "127.0.0.1");
        CHECK(r.Value().port == 9443);
    }
}

TEST_CASE("ParseListenAddress: invalid ports", "[config]") {
    CHECK(ParseListenAddress("").IsErr());
    CHECK(ParseListenAddress(":").IsErr());
    CHECK(ParseListenAddress(":abc").IsErr());
    CHECK(ParseListenAddress(":0").IsErr());
    CHECK(ParseListenAddress(":65536").IsErr());
    CHECK(ParseListenAddress(":123456").IsErr());
    CHECK(ParseListenAddress(":-1").IsErr());
}

TEST_CASE("ParseLogLevel: case-insensitive names", "[config]") {
    CHECK(ParseLogLevel("debug").Value() == LogLevel::Debug);
    CHECK(ParseLogLevel("INFO").Value() == LogLevel::Info);
    CHECK(ParseLogLevel("Warning").Value() == LogLevel::Warn);
    CHECK(ParseLogLevel("error").Value() == LogLevel::Error);
    CHECK(ParseLogLevel("trace").IsErr());
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: defaults", "[config][cli]") {
    auto result = ParseArgs({});
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.transport == TransportKind::Stdio);
    CHECK(config.listen.host == "0.0.0.0");
    CHECK(config.listen.port == 8080);
    CHECK(config.cert_file.empty());
    CHECK(config.key_file.empty());
    CHECK(config.logging.level == LogLevel::Warn);
    CHECK_FALSE(config.logging.log_file.has_value());
    CHECK_FALSE(config.logging.json);
    CHECK_FALSE(config.config_path.has_value());
}

TEST_CASE("LoadFromCli: https with cert and key", "[config][cli]") {
    auto result = ParseArgs({"--transport", "https", "--port", ":8443",
                             "--cert", "server.crt", "--key", "server.key"});
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.transport == TransportKind::Https);
    CHECK(config.listen.port == 8443);
    CHECK(config.cert_file == "server.crt");
    CHECK(config.key_file == "server.key");
}

TEST_CASE("LoadFromCli: logging flags", "[config][cli]") {
    SECTION("-v is info") {
        auto result = ParseArgs({"-v"});
        REQUIRE(result.IsOk());
        CHECK(result.Value().logging.level == LogLevel::Info);
    }
    SECTION("-vv is debug") {
        auto result = ParseArgs({"-vv"});
        REQUIRE(result.IsOk());
        CHECK(result.Value().logging.level == LogLevel::Debug);
    }
    SECTION("file, json and color") {
        auto result = ParseArgs({"--log-file", "server.log", "--log-json", "--no-color"});
        REQUIRE(result.IsOk());
        const auto& logging = result.Value().logging;
        REQUIRE(logging.log_file.has_value());
        CHECK(*logging.log_file == "server.log");
        CHECK(logging.json);
        CHECK(logging.force_no_color);
        CHECK_FALSE(logging.force_color);
    }
}

TEST_CASE("LoadFromCli: config path", "[config][cli]") {
    auto result = ParseArgs({"-c", "colors.yaml"});
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().config_path.has_value());
    CHECK(*result.Value().config_path == "colors.yaml");
}

TEST_CASE("LoadFromCli: invalid transport", "[config][cli]") {
    auto result = ParseArgs({"--transport", "ftp"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Invalid transport: ftp") != std::string::npos);
    CHECK(result.Error().ExitCode() == 1);
}

TEST_CASE("LoadFromCli: unknown flag", "[config][cli]") {
    auto result = ParseArgs({"--colour"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.transport == TransportKind::Http);
    CHECK(config.listen.host == "127.0.0.1");
    CHECK(config.listen.port == 9000);
    CHECK(config.logging.level == LogLevel::Info);
    REQUIRE(config.logging.log_file.has_value());
    CHECK(*config.logging.log_file == "/tmp/favorite-colors.log");
    CHECK(config.logging.json);
    REQUIRE(config.config_path.has_value());
    CHECK(*config.config_path == TestDataPath("valid_config.yaml"));
}

TEST_CASE("LoadFromYaml: https config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("https_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.transport == TransportKind::Https);
    CHECK(config.listen.port == 8443);
    CHECK(config.cert_file == "certificates/server.crt");
    CHECK(config.key_file == "certificates/server.key");
}

TEST_CASE("LoadFromYaml: invalid values", "[config][yaml]") {
    CHECK(LoadFromYaml(TestDataPath("invalid_transport.yaml")).IsErr());
    CHECK(LoadFromYaml(TestDataPath("invalid_port.yaml")).IsErr());
}

TEST_CASE("LoadFromYaml: malformed or missing file", "[config][yaml]") {
    auto malformed = LoadFromYaml(TestDataPath("malformed.yaml"));
    REQUIRE(malformed.IsErr());
    CHECK(malformed.Error().message.find("Failed to parse YAML file") != std::string::npos);

    CHECK(LoadFromYaml(TestDataPath("does_not_exist.yaml")).IsErr());
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI overrides YAML where set", "[config][merge]") {
    auto yaml = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(yaml.IsOk());

    auto cli = ParseArgs({"--port", ":7000"});
    REQUIRE(cli.IsOk());

    auto merged = MergeConfigs(yaml.Value(), cli.Value());
    CHECK(merged.transport == TransportKind::Http);
    CHECK(merged.listen.port == 7000);
    CHECK(merged.listen.host == "0.0.0.0");
    CHECK(merged.logging.level == LogLevel::Info);
    CHECK(merged.logging.json);
}

TEST_CASE("MergeConfigs: CLI defaults keep YAML values", "[config][merge]") {
    auto yaml = LoadFromYaml(TestDataPath("https_config.yaml"));
    REQUIRE(yaml.IsOk());

    auto cli = ParseArgs({"-vv"});
    REQUIRE(cli.IsOk());

    auto merged = MergeConfigs(yaml.Value(), cli.Value());
    CHECK(merged.transport == TransportKind::Https);
    CHECK(merged.listen.port == 8443);
    CHECK(merged.cert_file == "certificates/server.crt");
    CHECK(merged.logging.level == LogLevel::Debug);
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: stdio and http need nothing", "[config][validate]") {
    AppConfig config;
    CHECK(ValidateConfig(config).IsOk());
    config.transport = TransportKind::Http;
    CHECK(ValidateConfig(config).IsOk());
}

TEST_CASE("ValidateConfig: https requires cert and key", "[config][validate]") {
    AppConfig config;
    config.transport = TransportKind::Https;
    config.cert_file = "server.crt";

    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message ==
          "HTTPS transport requires both --cert and --key flags");
    CHECK(result.Error().ExitCode() == 1);
}

TEST_CASE("ValidateConfig: https files must exist", "[config][validate]") {
    TempFile cert("favorite_colors_test_server.crt");
    TempFile key("favorite_colors_test_server.key");

    AppConfig config;
    config.transport = TransportKind::Https;
    config.cert_file = cert.Path();
    config.key_file = key.Path();
    CHECK(ValidateConfig(config).IsOk());

    config.key_file = "/nonexistent/server.key";
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Tls);
    CHECK(result.Error().message == "TLS private key not found: /nonexistent/server.key");

    config.cert_file = "/nonexistent/server.crt";
    result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "TLS certificate not found: /nonexistent/server.crt");
}
