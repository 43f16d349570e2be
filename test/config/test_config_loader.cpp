#include <catch2/catch_test_macros.hpp>

#include <cashlog/config/config_loader.hpp>

#include <cstdlib>
#include <string>
#include <vector>

using namespace cashlog;

namespace {

// testdata lives next to the test sources; derive it from __FILE__ so the
// suite runs from any working directory.
std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto test_dir = this_file.substr(0, this_file.rfind('/'));       // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));       // .../test
    return test_root + "/testdata/" + filename;
}

Result<CliOptions, Error> ParseArgs(std::vector<const char*> args) {
    args.insert(args.begin(), "cashlog-mcp");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

AppConfig ValidConfig() {
    AppConfig config;
    config.store.path = "logistics.db";
    return config;
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.store.path == "/var/lib/cashlog/logistics.db");
    CHECK(config.store.max_result_rows == 500);
    CHECK(config.store.query_timeout_ms == 2000);

    CHECK(config.rules.high_volume_threshold == 25000.0);
    CHECK(config.rules.cash_sitting_hours == 36.0);
    CHECK(config.rules.trailing_volume_days == 14);
    CHECK(config.rules.deposit_history_days == 60);
    CHECK(config.rules.peak_day_tolerance_days == 2);
    CHECK(config.rules.low_volume_threshold == 8000.0);
    CHECK(config.rules.over_service_min_pickups == 4);
    CHECK(config.rules.under_service_max_pickups == 1);
    CHECK(config.rules.consolidation_max_distance_km == 10.5);
    CHECK(config.rules.max_range_days == 93);

    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/var/log/cashlog.log");
    CHECK(config.log_json);
    CHECK(config.verbosity == 1);
    CHECK_FALSE(config.quiet);
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.store.path == "logistics.db");
    CHECK(config.store.max_result_rows == 10000);
    CHECK(config.store.query_timeout_ms == 5000);
    CHECK(config.rules.high_volume_threshold == 30000.0);
    CHECK(config.rules.cash_sitting_hours == 48.0);
    CHECK_FALSE(config.log_file.has_value());
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::InvalidArguments);
    CHECK(result.Error().operation == "ConfigLoader");
}

TEST_CASE("LoadFromYaml: malformed YAML", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("malformed_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Failed to parse YAML") != std::string::npos);
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no args", "[config][cli]") {
    auto result = ParseArgs({});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK_FALSE(cli.db_path.has_value());
    CHECK_FALSE(cli.config_file.has_value());
    CHECK(cli.verbosity == 0);
    CHECK_FALSE(cli.quiet);
    CHECK_FALSE(cli.show_version);
}

TEST_CASE("LoadFromCli: store and rule flags", "[config][cli]") {
    auto result = ParseArgs({"--db", "cash.db", "--max-rows", "50",
                             "--timeout-ms", "250",
                             "--high-volume-threshold", "12000.5",
                             "--cash-sitting-hours", "24"});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK(*cli.db_path == "cash.db");
    CHECK(*cli.max_result_rows == 50);
    CHECK(*cli.query_timeout_ms == 250);
    CHECK(*cli.high_volume_threshold == 12000.5);
    CHECK(*cli.cash_sitting_hours == 24.0);
}

TEST_CASE("LoadFromCli: verbosity flags", "[config][cli]") {
    CHECK(ParseArgs({"-v"}).Value().verbosity == 1);
    CHECK(ParseArgs({"-vv"}).Value().verbosity == 2);
    CHECK(ParseArgs({"--debug"}).Value().verbosity == 2);
    CHECK(ParseArgs({"-q"}).Value().quiet);
}

TEST_CASE("LoadFromCli: logging flags", "[config][cli]") {
    auto result = ParseArgs({"--log-file", "/tmp/cashlog.log", "--log-json"});
    REQUIRE(result.IsOk());
    CHECK(*result.Value().log_file == "/tmp/cashlog.log");
    CHECK(result.Value().log_json);
}

TEST_CASE("LoadFromCli: version flag", "[config][cli]") {
    auto result = ParseArgs({"--version"});
    REQUIRE(result.IsOk());
    CHECK(result.Value().show_version);
}

TEST_CASE("LoadFromCli: non-numeric max rows", "[config][cli]") {
    auto result = ParseArgs({"--max-rows", "lots"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::InvalidArguments);
}

TEST_CASE("LoadFromCli: unknown flag", "[config][cli]") {
    auto result = ParseArgs({"--frobnicate"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("CLI parse error") != std::string::npos);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI overrides YAML values", "[config][merge]") {
    AppConfig base = ValidConfig();
    base.store.max_result_rows = 100;
    base.rules.high_volume_threshold = 20000.0;

    CliOptions cli;
    cli.db_path = "other.db";
    cli.max_result_rows = 7;
    cli.high_volume_threshold = 45000.0;
    cli.verbosity = 2;

    auto merged = MergeConfigs(base, cli);
    CHECK(merged.store.path == "other.db");
    CHECK(merged.store.max_result_rows == 7);
    CHECK(merged.rules.high_volume_threshold == 45000.0);
    CHECK(merged.verbosity == 2);
}

TEST_CASE("MergeConfigs: YAML values preserved when CLI not set", "[config][merge]") {
    AppConfig base = ValidConfig();
    base.store.query_timeout_ms = 1234;
    base.rules.cash_sitting_hours = 12.0;
    base.log_file = "/var/log/cashlog.log";
    base.verbosity = 1;

    auto merged = MergeConfigs(base, CliOptions{});
    CHECK(merged.store.path == "logistics.db");
    CHECK(merged.store.query_timeout_ms == 1234);
    CHECK(merged.rules.cash_sitting_hours == 12.0);
    CHECK(*merged.log_file == "/var/log/cashlog.log");
    CHECK(merged.verbosity == 1);
}

// ===========================================================================
// ResolveStorePathEnv
// ===========================================================================

TEST_CASE("ResolveStorePathEnv: fills empty path from environment", "[config][env]") {
    setenv("CASHLOG_TEST_DB", "/data/from-env.db", 1);
    auto config = ResolveStorePathEnv(AppConfig{}, "CASHLOG_TEST_DB");
    CHECK(config.store.path == "/data/from-env.db");
    unsetenv("CASHLOG_TEST_DB");
}

TEST_CASE("ResolveStorePathEnv: explicit path wins", "[config][env]") {
    setenv("CASHLOG_TEST_DB", "/data/from-env.db", 1);
    auto config = ResolveStorePathEnv(ValidConfig(), "CASHLOG_TEST_DB");
    CHECK(config.store.path == "logistics.db");
    unsetenv("CASHLOG_TEST_DB");
}

TEST_CASE("ResolveStorePathEnv: unset variable leaves path empty", "[config][env]") {
    unsetenv("CASHLOG_TEST_DB_UNSET");
    auto config = ResolveStorePathEnv(AppConfig{}, "CASHLOG_TEST_DB_UNSET");
    CHECK(config.store.path.empty());
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: valid config passes", "[config][validate]") {
    CHECK(ValidateConfig(ValidConfig()).IsOk());
}

TEST_CASE("ValidateConfig: missing store path", "[config][validate]") {
    auto result = ValidateConfig(AppConfig{});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("store.path") != std::string::npos);
}

TEST_CASE("ValidateConfig: non-positive limits", "[config][validate]") {
    auto config = ValidConfig();
    config.store.max_result_rows = 0;
    CHECK(ValidateConfig(config).IsErr());

    config = ValidConfig();
    config.store.query_timeout_ms = -5;
    CHECK(ValidateConfig(config).IsErr());
}

TEST_CASE("ValidateConfig: low threshold above high threshold", "[config][validate]") {
    auto config = ValidConfig();
    config.rules.low_volume_threshold = 40000.0;
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("low_volume_threshold") != std::string::npos);
}

TEST_CASE("ValidateConfig: rule ranges", "[config][validate]") {
    auto config = ValidConfig();
    config.rules.peak_day_tolerance_days = 4;
    CHECK(ValidateConfig(config).IsErr());

    config = ValidConfig();
    config.rules.over_service_min_pickups = 8;
    CHECK(ValidateConfig(config).IsErr());

    config = ValidConfig();
    config.rules.cash_sitting_hours = 0;
    CHECK(ValidateConfig(config).IsErr());

    config = ValidConfig();
    config.rules.consolidation_max_distance_km = 0;
    CHECK(ValidateConfig(config).IsErr());

    config = ValidConfig();
    config.rules.max_range_days = 0;
    CHECK(ValidateConfig(config).IsErr());
}
