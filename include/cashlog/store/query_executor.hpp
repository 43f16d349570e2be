#pragma once

#include <cashlog/store/i_query_executor.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

struct sqlite3;

namespace cashlog {

struct ExecutorOptions {
    int max_result_rows = 10000;
    std::chrono::milliseconds query_timeout{5000};
    // Tests only: create an empty database when the file does not exist.
    bool create_if_missing = false;
};

// ---------------------------------------------------------------------------
// QueryExecutor — SQLite-backed IQueryExecutor.
//
// Exclusively owns the connection for its lifetime. Each Execute() runs in
// its own transaction (DEFERRED for reads, IMMEDIATE for writes), enforces
// the row ceiling and the per-query deadline, and rolls back on any failure.
// ---------------------------------------------------------------------------
class QueryExecutor : public IQueryExecutor {
    struct OpenKey {
        explicit OpenKey() = default;
    };

public:
    /// Open an existing database. Fails with FatalStartup when the file is
    /// missing, unreadable or not a SQLite database.
    static Result<std::unique_ptr<QueryExecutor>, Error> Open(
        const std::string& path, const ExecutorOptions& options = {});

    // Only Open() can name OpenKey.
    QueryExecutor(OpenKey, sqlite3* db, std::string path, ExecutorOptions options);
    ~QueryExecutor() override;

    QueryExecutor(const QueryExecutor&) = delete;
    QueryExecutor& operator=(const QueryExecutor&) = delete;

    using IQueryExecutor::Execute;
    Result<QueryResult, Error> Execute(std::string_view sql,
                                       ExecutionMode mode,
                                       const std::vector<Value>& params) override;

    [[nodiscard]] const ExecutorOptions& Options() const noexcept { return options_; }
    [[nodiscard]] const std::string& Path() const noexcept { return path_; }

private:
    static int OnProgress(void* self);

    Error StoreError(const std::string& operation) const;

    sqlite3* db_;
    std::string path_;
    ExecutorOptions options_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    bool timed_out_ = false;
};

} // namespace cashlog
