#include <cashlog/config/config_loader.hpp>
#include <cashlog/core/log.hpp>
#include <cashlog/core/version.hpp>
#include <cashlog/mcp/mcp_server.hpp>
#include <cashlog/mcp/tool_dispatcher.hpp>
#include <cashlog/store/query_executor.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess       = 0;
constexpr int kExitConfig        = 1;
constexpr int kExitStartup       = 2;
constexpr int kExitDecodeFailure = 3;
constexpr int kExitIo            = 4;

cashlog::LogLevel ResolveLogLevel(const cashlog::AppConfig& config) {
    using cashlog::LogLevel;
    if (config.quiet) return LogLevel::Error;
    if (config.verbosity >= 2) return LogLevel::Debug;
    if (config.verbosity == 1) return LogLevel::Info;
    return LogLevel::Warn;
}

// Logs go to stderr or the configured file; stdout carries protocol frames.
bool InitLogging(const cashlog::AppConfig& config) {
    using namespace cashlog;
    const auto level = ResolveLogLevel(config);

    if (config.log_file) {
        auto sink = std::make_unique<FileSink>(*config.log_file, config.log_json);
        if (!sink->IsOpen()) {
            std::cerr << "Error: cannot open log file " << *config.log_file << "\n";
            return false;
        }
        InitGlobalLogger(std::move(sink), level);
        return true;
    }
    if (config.log_json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), level);
    } else {
        InitGlobalLogger(std::make_unique<StreamSink>(std::cerr), level);
    }
    return true;
}

int ExitCodeFor(cashlog::ExitReason reason) {
    switch (reason) {
        case cashlog::ExitReason::EndOfInput: return kExitSuccess;
        case cashlog::ExitReason::DecodeFailure: return kExitDecodeFailure;
        case cashlog::ExitReason::IoError: return kExitIo;
    }
    return kExitIo;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace cashlog;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        std::cerr << "Error: " << cli.Error().message << "\n";
        return kExitConfig;
    }
    if (cli.Value().show_version) {
        std::cout << "cashlog-mcp " << kVersion << "\n";
        return kExitSuccess;
    }

    AppConfig base;
    if (cli.Value().config_file) {
        auto loaded = LoadFromYaml(*cli.Value().config_file);
        if (loaded.IsErr()) {
            std::cerr << "Error: " << loaded.Error().message << "\n";
            return kExitConfig;
        }
        base = loaded.Value();
    }

    auto config = ResolveStorePathEnv(MergeConfigs(base, cli.Value()));
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        std::cerr << "Error: " << valid.Error().message << "\n";
        return kExitConfig;
    }

    if (!InitLogging(config)) {
        return kExitConfig;
    }
    LogInfo("main", std::string("cashlog-mcp ") + kVersion + " starting");

    ExecutorOptions options;
    options.max_result_rows = config.store.max_result_rows;
    options.query_timeout = std::chrono::milliseconds(config.store.query_timeout_ms);

    auto executor = QueryExecutor::Open(config.store.path, options);
    if (executor.IsErr()) {
        const auto& error = executor.Error();
        LogError("main", error.ToString());
        std::cerr << "Error: " << error.message << "\n";
        return error.kind == ErrorKind::FatalStartup ? kExitStartup : error.ExitCode();
    }

    McpServer server(ToolDispatcher(*executor.Value()), config.rules,
                     std::cin, std::cout);
    const auto reason = server.Run();
    LogInfo("main", std::string("Server stopped in state ") +
            ServerStateName(server.State()));
    return ExitCodeFor(reason);
}
