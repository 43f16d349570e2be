#include <cashlog/config/config_loader.hpp>

#include <cashlog/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <string>
#include <vector>

namespace cashlog {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Make(ErrorKind::InvalidArguments, "ConfigLoader", message);
}

template <typename T>
void ReadIfPresent(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

void ParseStoreSection(const YAML::Node& node, StoreConfig& store) {
    ReadIfPresent(node, "path", store.path);
    ReadIfPresent(node, "max_result_rows", store.max_result_rows);
    ReadIfPresent(node, "query_timeout_ms", store.query_timeout_ms);
}

void ParseRulesSection(const YAML::Node& node, RuleConfig& rules) {
    ReadIfPresent(node, "high_volume_threshold", rules.high_volume_threshold);
    ReadIfPresent(node, "cash_sitting_hours", rules.cash_sitting_hours);
    ReadIfPresent(node, "trailing_volume_days", rules.trailing_volume_days);
    ReadIfPresent(node, "deposit_history_days", rules.deposit_history_days);
    ReadIfPresent(node, "peak_day_tolerance_days", rules.peak_day_tolerance_days);
    ReadIfPresent(node, "low_volume_threshold", rules.low_volume_threshold);
    ReadIfPresent(node, "over_service_min_pickups", rules.over_service_min_pickups);
    ReadIfPresent(node, "under_service_max_pickups", rules.under_service_max_pickups);
    ReadIfPresent(node, "consolidation_max_distance_km",
                  rules.consolidation_max_distance_km);
    ReadIfPresent(node, "max_range_days", rules.max_range_days);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    try {
        const YAML::Node root = YAML::LoadFile(std::string(file_path));

        if (root["store"]) {
            ParseStoreSection(root["store"], config.store);
        }
        if (root["rules"]) {
            ParseRulesSection(root["rules"], config.rules);
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        ReadIfPresent(root, "log_json", config.log_json);
        ReadIfPresent(root, "verbosity", config.verbosity);
        ReadIfPresent(root, "quiet", config.quiet);
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("cashlog-mcp", kVersion,
                                     argparse::default_arguments::help);

    program.add_argument("--db")
        .help("Path to the cash-logistics SQLite database");
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--max-rows")
        .help("Maximum rows a single query may return")
        .scan<'i', int>();
    program.add_argument("--timeout-ms")
        .help("Per-query timeout in milliseconds")
        .scan<'i', int>();
    program.add_argument("--high-volume-threshold")
        .help("Average daily cash volume that marks a high-volume location")
        .scan<'g', double>();
    program.add_argument("--cash-sitting-hours")
        .help("Hours of uncollected cash that make any location high risk")
        .scan<'g', double>();
    program.add_argument("--log-file")
        .help("Append logs to this file instead of stderr");
    program.add_argument("--log-json")
        .help("Emit logs as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Log at info level (-vv for debug)")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--debug")
        .help("Log at debug level")
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

    // "-vv" is shorthand for --debug.
    std::vector<std::string> args;
    args.reserve(static_cast<size_t>(argc));
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        args.push_back(arg == "-vv" ? "--debug" : arg);
    }

    try {
        program.parse_args(args);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions cli;
    cli.config_file = program.present("--config");
    cli.db_path = program.present("--db");
    cli.max_result_rows = program.present<int>("--max-rows");
    cli.query_timeout_ms = program.present<int>("--timeout-ms");
    cli.high_volume_threshold = program.present<double>("--high-volume-threshold");
    cli.cash_sitting_hours = program.present<double>("--cash-sitting-hours");
    cli.log_file = program.present("--log-file");
    cli.log_json = program.get<bool>("--log-json");
    cli.quiet = program.get<bool>("--quiet");
    cli.show_version = program.get<bool>("--version");
    if (program.get<bool>("--debug")) {
        cli.verbosity = 2;
    } else if (program.get<bool>("--verbose")) {
        cli.verbosity = 1;
    }

    return Result<CliOptions, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const CliOptions& cli) {
    AppConfig merged = base;

    if (cli.db_path.has_value()) {
        merged.store.path = *cli.db_path;
    }
    if (cli.max_result_rows.has_value()) {
        merged.store.max_result_rows = *cli.max_result_rows;
    }
    if (cli.query_timeout_ms.has_value()) {
        merged.store.query_timeout_ms = *cli.query_timeout_ms;
    }
    if (cli.high_volume_threshold.has_value()) {
        merged.rules.high_volume_threshold = *cli.high_volume_threshold;
    }
    if (cli.cash_sitting_hours.has_value()) {
        merged.rules.cash_sitting_hours = *cli.cash_sitting_hours;
    }
    if (cli.log_file.has_value()) {
        merged.log_file = cli.log_file;
    }
    if (cli.log_json) {
        merged.log_json = true;
    }
    if (cli.verbosity > merged.verbosity) {
        merged.verbosity = cli.verbosity;
    }
    if (cli.quiet) {
        merged.quiet = true;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveStorePathEnv
// ---------------------------------------------------------------------------
AppConfig ResolveStorePathEnv(AppConfig config, const char* env_var) {
    if (config.store.path.empty()) {
        const char* env_val = std::getenv(env_var);
        if (env_val != nullptr) {
            config.store.path = env_val;
        }
    }
    return config;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    auto fail = [](const std::string& msg) {
        return Result<void, Error>::Err(MakeConfigError(msg));
    };

    if (config.store.path.empty()) {
        return fail("Missing required field: store.path (or --db / CASHLOG_DB)");
    }
    if (config.store.max_result_rows <= 0) {
        return fail("store.max_result_rows must be positive");
    }
    if (config.store.query_timeout_ms <= 0) {
        return fail("store.query_timeout_ms must be positive");
    }

    const auto& r = config.rules;
    if (r.high_volume_threshold < 0 || r.low_volume_threshold < 0) {
        return fail("Volume thresholds must not be negative");
    }
    if (r.low_volume_threshold > r.high_volume_threshold) {
        return fail("rules.low_volume_threshold must not exceed "
                    "rules.high_volume_threshold");
    }
    if (r.cash_sitting_hours <= 0) {
        return fail("rules.cash_sitting_hours must be positive");
    }
    if (r.trailing_volume_days <= 0 || r.deposit_history_days <= 0) {
        return fail("Volume windows must be positive");
    }
    if (r.peak_day_tolerance_days < 0 || r.peak_day_tolerance_days > 3) {
        return fail("rules.peak_day_tolerance_days must be within 0..3");
    }
    if (r.over_service_min_pickups < 1 || r.over_service_min_pickups > 7 ||
        r.under_service_max_pickups < 0 || r.under_service_max_pickups > 7) {
        return fail("Pickup frequency thresholds must be within 0..7 per week");
    }
    if (r.consolidation_max_distance_km <= 0) {
        return fail("rules.consolidation_max_distance_km must be positive");
    }
    if (r.max_range_days <= 0) {
        return fail("rules.max_range_days must be positive");
    }

    return Result<void, Error>::Ok();
}

} // namespace cashlog
