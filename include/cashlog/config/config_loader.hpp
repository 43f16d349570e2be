#pragma once

#include <cashlog/config/app_config.hpp>
#include <cashlog/core/result.hpp>

#include <string_view>

namespace cashlog {

// Parse a YAML config file into an AppConfig. Absent keys keep defaults.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse command-line flags.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Apply CLI flags on top of a base config; CLI wins where present.
AppConfig MergeConfigs(const AppConfig& base, const CliOptions& cli);

// Fill store.path from the named environment variable when still empty.
AppConfig ResolveStorePathEnv(AppConfig config, const char* env_var = "CASHLOG_DB");

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace cashlog
