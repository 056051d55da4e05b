#include <catch2/catch_test_macros.hpp>

#include <ens_mcp/config/config_loader.hpp>

#include <string>

using namespace ens_mcp;

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests run from the build directory; derive the source tree's testdata
// directory from this file's path.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

template <size_t N>
Result<CliOptions, Error> Cli(const char* (&argv)[N]) {
    return LoadFromCli(static_cast<int>(N), argv);
}

} // anonymous namespace

// ===========================================================================
// ParseTransport
// ===========================================================================

TEST_CASE("ParseTransport: known names", "[config]") {
    CHECK(ParseTransport("stdio") == Transport::Stdio);
    CHECK(ParseTransport("test") == Transport::Test);
    CHECK(ParseTransport("STDIO") == Transport::Stdio);
    CHECK_FALSE(ParseTransport("sse").has_value());
    CHECK_FALSE(ParseTransport("").has_value());
}

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto path = TestDataPath("full_config.yaml");
    auto result = LoadFromYaml(path);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.rpc_url == "https://mainnet.infura.io/v3/0123456789abcdef");
    CHECK(config.transport == Transport::Test);
    REQUIRE(config.registry_address.has_value());
    CHECK(*config.registry_address == "0x00000000000c2e074ec69a0dfb2997ba6c7d2e1e");
    CHECK(config.timeout_seconds == 10);
    CHECK(config.log_level == LogLevel::Debug);
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/ens-mcp.log");
    CHECK(config.log_json);
    REQUIRE(config.config_file.has_value());
    CHECK(*config.config_file == path);
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.rpc_url == "http://localhost:8545");
    CHECK(config.transport == Transport::Stdio);          // default
    CHECK_FALSE(config.registry_address.has_value());
    CHECK(config.timeout_seconds == 30);                  // default
    CHECK(config.log_level == LogLevel::Info);            // default
    CHECK_FALSE(config.log_json);
}

TEST_CASE("LoadFromYaml: empty document is OK", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("empty_config.yaml"));
    REQUIRE(result.IsOk());
    CHECK(result.Value().rpc_url == kDefaultRpcUrl);
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml("/nonexistent/path/config.yaml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "ConfigLoader");
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromYaml: invalid transport", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_transport.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Invalid transport: websocket");
}

TEST_CASE("LoadFromYaml: wrongly typed value", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_timeout.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Invalid value in config file") != std::string::npos);
}

TEST_CASE("LoadFromYaml: root must be a mapping", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("sequence_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Config file must be a YAML mapping");
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no args sets nothing", "[config][cli]") {
    const char* argv[] = {"ens-mcp"};
    auto result = Cli(argv);
    REQUIRE(result.IsOk());
    const auto& options = result.Value();

    CHECK_FALSE(options.rpc_url.has_value());
    CHECK_FALSE(options.transport.has_value());
    CHECK_FALSE(options.timeout_seconds.has_value());
    CHECK_FALSE(options.log_level.has_value());
    CHECK_FALSE(options.color.has_value());
    CHECK_FALSE(options.show_version);
    CHECK_FALSE(options.config_file.has_value());

    auto config = MergeConfigs(AppConfig{}, options);
    CHECK(config.rpc_url == kDefaultRpcUrl);
    CHECK(config.transport == Transport::Stdio);
    CHECK(config.timeout_seconds == 30);
    CHECK(config.log_level == LogLevel::Info);
}

TEST_CASE("LoadFromCli: all options", "[config][cli]") {
    const char* argv[] = {
        "ens-mcp",
        "--rpc-url", "http://localhost:8545",
        "--registry", "0x00000000000c2e074ec69a0dfb2997ba6c7d2e1e",
        "--timeout", "5",
        "--transport", "test",
        "--config", "/etc/ens-mcp.yaml",
        "--log-level", "warn",
        "--log-file", "/tmp/x.log",
        "--log-json",
        "--no-color",
    };
    auto result = Cli(argv);
    REQUIRE(result.IsOk());
    const auto config = MergeConfigs(AppConfig{}, result.Value());

    CHECK(config.rpc_url == "http://localhost:8545");
    REQUIRE(config.registry_address.has_value());
    CHECK(config.timeout_seconds == 5);
    CHECK(config.transport == Transport::Test);
    REQUIRE(config.config_file.has_value());
    CHECK(*config.config_file == "/etc/ens-mcp.yaml");
    CHECK(config.log_level == LogLevel::Warn);
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/x.log");
    CHECK(config.log_json);
    REQUIRE(config.color.has_value());
    CHECK_FALSE(*config.color);
}

TEST_CASE("LoadFromCli: --verbose wins over --log-level", "[config][cli]") {
    const char* argv[] = {"ens-mcp", "--log-level", "error", "-v"};
    auto result = Cli(argv);
    REQUIRE(result.IsOk());
    CHECK(result.Value().log_level == LogLevel::Debug);
}

TEST_CASE("LoadFromCli: --version", "[config][cli]") {
    const char* argv[] = {"ens-mcp", "--version"};
    auto result = Cli(argv);
    REQUIRE(result.IsOk());
    CHECK(result.Value().show_version);
}

TEST_CASE("LoadFromCli: --color forces color", "[config][cli]") {
    const char* argv[] = {"ens-mcp", "--color"};
    auto result = Cli(argv);
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().color.has_value());
    CHECK(*result.Value().color);
}

TEST_CASE("LoadFromCli: --color with --no-color is an error", "[config][cli]") {
    const char* argv[] = {"ens-mcp", "--color", "--no-color"};
    auto result = Cli(argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromCli: invalid transport", "[config][cli]") {
    const char* argv[] = {"ens-mcp", "--transport", "http"};
    auto result = Cli(argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Invalid --transport: http (expected stdio or test)");
}

TEST_CASE("LoadFromCli: invalid log level", "[config][cli]") {
    const char* argv[] = {"ens-mcp", "--log-level", "loud"};
    auto result = Cli(argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Invalid --log-level: loud");
}

TEST_CASE("LoadFromCli: non-numeric timeout", "[config][cli]") {
    const char* argv[] = {"ens-mcp", "--timeout", "soon"};
    auto result = Cli(argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("CLI parse error") != std::string::npos);
}

TEST_CASE("LoadFromCli: unknown flag", "[config][cli]") {
    const char* argv[] = {"ens-mcp", "--frobnicate"};
    auto result = Cli(argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "ConfigLoader");
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI overrides YAML", "[config][merge]") {
    AppConfig yaml;
    yaml.rpc_url = "http://yaml:8545";
    yaml.timeout_seconds = 10;
    yaml.log_level = LogLevel::Debug;
    yaml.log_file = "/var/log/yaml.log";

    CliOptions cli;
    cli.rpc_url = "http://cli:8545";
    cli.transport = Transport::Test;
    cli.color = false;

    auto merged = MergeConfigs(yaml, cli);

    CHECK(merged.rpc_url == "http://cli:8545");
    CHECK(merged.transport == Transport::Test);
    CHECK(merged.timeout_seconds == 10);             // not passed on the CLI
    CHECK(merged.log_level == LogLevel::Debug);      // not passed on the CLI
    REQUIRE(merged.log_file.has_value());
    CHECK(*merged.log_file == "/var/log/yaml.log");
    REQUIRE(merged.color.has_value());
    CHECK_FALSE(*merged.color);
}

TEST_CASE("MergeConfigs: YAML fills what the CLI left out", "[config][merge]") {
    AppConfig yaml;
    yaml.registry_address = "0x00000000000c2e074ec69a0dfb2997ba6c7d2e1e";
    yaml.log_json = true;

    auto merged = MergeConfigs(yaml, CliOptions{});

    REQUIRE(merged.registry_address.has_value());
    CHECK(*merged.registry_address == *yaml.registry_address);
    CHECK(merged.log_json);
    CHECK(merged.rpc_url == kDefaultRpcUrl);
}

TEST_CASE("MergeConfigs: explicit CLI values equal to the defaults still win",
          "[config][merge]") {
    auto yaml = LoadFromYaml(TestDataPath("full_config.yaml"));
    REQUIRE(yaml.IsOk());
    REQUIRE(yaml.Value().transport == Transport::Test);
    REQUIRE(yaml.Value().timeout_seconds == 10);

    const char* argv[] = {
        "ens-mcp",
        "--transport", "stdio",
        "--timeout", "30",
        "--log-level", "info",
        "--rpc-url", kDefaultRpcUrl,
    };
    auto cli = Cli(argv);
    REQUIRE(cli.IsOk());

    auto merged = MergeConfigs(yaml.Value(), cli.Value());

    CHECK(merged.transport == Transport::Stdio);
    CHECK(merged.timeout_seconds == 30);
    CHECK(merged.log_level == LogLevel::Info);
    CHECK(merged.rpc_url == kDefaultRpcUrl);
    CHECK(merged.log_json);                          // from YAML
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: defaults are valid", "[config][validate]") {
    CHECK(ValidateConfig(AppConfig{}).IsOk());
}

TEST_CASE("ValidateConfig: bad RPC URL", "[config][validate]") {
    AppConfig config;
    config.rpc_url = "ftp://example.com";
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.rfind("Invalid RPC URL: ", 0) == 0);
}

TEST_CASE("ValidateConfig: bad registry address", "[config][validate]") {
    AppConfig config;
    config.registry_address = "0x1234";
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Invalid registry address: 0x1234");
}

TEST_CASE("ValidateConfig: non-positive timeout", "[config][validate]") {
    AppConfig config;
    config.timeout_seconds = 0;
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Invalid timeout: 0 (must be positive)");
}
