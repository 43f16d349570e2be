#pragma once

#include <cashlog/rules/rule_config.hpp>

#include <optional>
#include <string>

namespace cashlog {

struct StoreConfig {
    std::string path;
    int max_result_rows = 10000;
    int query_timeout_ms = 5000;
};

struct AppConfig {
    StoreConfig store;
    RuleConfig rules;
    std::optional<std::string> log_file;
    bool log_json = false;
    int verbosity = 0;   // 0 = warn, 1 = info, 2 = debug
    bool quiet = false;
};

// Flags given on the command line. Only present values override the
// YAML/default configuration.
struct CliOptions {
    std::optional<std::string> config_file;
    std::optional<std::string> db_path;
    std::optional<int> max_result_rows;
    std::optional<int> query_timeout_ms;
    std::optional<double> high_volume_threshold;
    std::optional<double> cash_sitting_hours;
    std::optional<std::string> log_file;
    bool log_json = false;
    int verbosity = 0;
    bool quiet = false;
    bool show_version = false;
};

} // namespace cashlog
