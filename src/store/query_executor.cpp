#include <cashlog/store/query_executor.hpp>

#include <cashlog/core/log.hpp>
#include <cashlog/store/statement_guard.hpp>

#include <sqlite3.h>

#include <memory>
#include <string>

namespace cashlog {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

// Rolls back on destruction unless Commit() succeeded.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {}
    ~Transaction() {
        if (active_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    int Begin(ExecutionMode mode) {
        const char* sql = mode == ExecutionMode::ReadWrite
            ? "BEGIN IMMEDIATE" : "BEGIN DEFERRED";
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
        active_ = rc == SQLITE_OK;
        return rc;
    }

    int Commit() {
        int rc = sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr);
        if (rc == SQLITE_OK) active_ = false;
        return rc;
    }

private:
    sqlite3* db_;
    bool active_ = false;
};

Value ReadColumn(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, col));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, col);
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
        }
        case SQLITE_BLOB: {
            const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, col));
            const int size = sqlite3_column_bytes(stmt, col);
            Blob blob;
            if (data != nullptr && size > 0) {
                blob.bytes.assign(data, data + size);
            }
            return blob;
        }
        default:
            return std::monostate{};
    }
}

int BindValue(sqlite3_stmt* stmt, int index, const Value& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return sqlite3_bind_int64(stmt, index, *i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return sqlite3_bind_double(stmt, index, *d);
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return sqlite3_bind_text(stmt, index, s->c_str(),
                                 static_cast<int>(s->size()), SQLITE_TRANSIENT);
    }
    if (const auto* b = std::get_if<Blob>(&value)) {
        return sqlite3_bind_blob(stmt, index, b->bytes.data(),
                                 static_cast<int>(b->bytes.size()), SQLITE_TRANSIENT);
    }
    return sqlite3_bind_null(stmt, index);
}

Error MakeStartupError(const std::string& message) {
    return Error::Make(ErrorKind::FatalStartup, "QueryExecutor::Open", message);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Open
// ---------------------------------------------------------------------------
Result<std::unique_ptr<QueryExecutor>, Error> QueryExecutor::Open(
    const std::string& path, const ExecutorOptions& options) {
    using R = Result<std::unique_ptr<QueryExecutor>, Error>;

    if (path.empty()) {
        return R::Err(MakeStartupError("Store path is empty"));
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX;
    if (options.create_if_missing) {
        flags |= SQLITE_OPEN_CREATE;
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string err = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        auto error = MakeStartupError("Failed to open '" + path + "': " + err);
        error.sqlite_code = rc;
        return R::Err(std::move(error));
    }

    sqlite3_extended_result_codes(db, 1);
    sqlite3_busy_timeout(db, static_cast<int>(options.query_timeout.count()));

    // sqlite3_open_v2 is lazy; reading the schema proves the file is a database.
    char* err = nullptr;
    rc = sqlite3_exec(db, "SELECT count(*) FROM sqlite_master", nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        sqlite3_close(db);
        auto error = MakeStartupError("'" + path + "' is not a readable database: " + msg);
        error.sqlite_code = rc;
        return R::Err(std::move(error));
    }

    LogInfo("store", "Opened " + path);
    return R::Ok(std::make_unique<QueryExecutor>(OpenKey{}, db, path, options));
}

QueryExecutor::QueryExecutor(OpenKey, sqlite3* db, std::string path,
                             ExecutorOptions options)
    : db_(db), path_(std::move(path)), options_(options) {
    sqlite3_progress_handler(db_, 1000, &QueryExecutor::OnProgress, this);
}

QueryExecutor::~QueryExecutor() {
    if (db_) {
        sqlite3_progress_handler(db_, 0, nullptr, nullptr);
        sqlite3_close(db_);
    }
}

int QueryExecutor::OnProgress(void* self) {
    auto* executor = static_cast<QueryExecutor*>(self);
    if (executor->deadline_ &&
        std::chrono::steady_clock::now() > *executor->deadline_) {
        executor->timed_out_ = true;
        return 1;  // interrupts the running statement
    }
    return 0;
}

Error QueryExecutor::StoreError(const std::string& operation) const {
    Error error = Error::Make(ErrorKind::QueryError, operation, sqlite3_errmsg(db_));
    error.sqlite_code = sqlite3_extended_errcode(db_);
    return error;
}

// ---------------------------------------------------------------------------
// Execute
// ---------------------------------------------------------------------------
Result<QueryResult, Error> QueryExecutor::Execute(std::string_view sql,
                                                  ExecutionMode mode,
                                                  const std::vector<Value>& params) {
    using R = Result<QueryResult, Error>;
    const std::string op = mode == ExecutionMode::ReadOnly
        ? "Execute(read)" : "Execute(write)";

    auto check = CheckStatement(sql, mode);
    if (check.IsErr()) {
        LogWarn("store", check.Error().ToString());
        return R::Err(check.Error());
    }

    // Declared before the deadline guard so the rollback runs unarmed.
    Transaction txn(db_);

    timed_out_ = false;
    deadline_ = std::chrono::steady_clock::now() + options_.query_timeout;
    struct DeadlineReset {
        std::optional<std::chrono::steady_clock::time_point>& deadline;
        ~DeadlineReset() { deadline.reset(); }
    } reset{deadline_};

    auto timeout_error = [&]() {
        return Error::Make(ErrorKind::QueryTimeout, op,
            "Query exceeded " + std::to_string(options_.query_timeout.count()) +
            " ms and was aborted");
    };

    if (txn.Begin(mode) != SQLITE_OK) {
        return R::Err(timed_out_ ? timeout_error() : StoreError(op));
    }

    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()),
                                &raw, nullptr);
    StatementPtr stmt(raw);
    if (rc != SQLITE_OK) {
        return R::Err(timed_out_ ? timeout_error() : StoreError(op));
    }
    if (!stmt) {
        return R::Err(Error::Make(ErrorKind::InvalidArguments, op,
                                  "Statement is empty"));
    }

    if (mode == ExecutionMode::ReadOnly && !sqlite3_stmt_readonly(stmt.get())) {
        return R::Err(Error::Make(ErrorKind::ForbiddenOperation, op,
            "Statement modifies the database; use write_query"));
    }

    const int expected = sqlite3_bind_parameter_count(stmt.get());
    if (expected != static_cast<int>(params.size())) {
        return R::Err(Error::Make(ErrorKind::InvalidArguments, op,
            "Statement expects " + std::to_string(expected) +
            " parameters, got " + std::to_string(params.size())));
    }
    for (size_t i = 0; i < params.size(); ++i) {
        if (BindValue(stmt.get(), static_cast<int>(i) + 1, params[i]) != SQLITE_OK) {
            return R::Err(StoreError(op));
        }
    }

    QueryResult result;
    const int column_count = sqlite3_column_count(stmt.get());
    result.columns.reserve(static_cast<size_t>(column_count));
    for (int c = 0; c < column_count; ++c) {
        const char* name = sqlite3_column_name(stmt.get(), c);
        result.columns.emplace_back(name ? name : "");
    }

    // sqlite3_changes() is stale after DDL or SELECT; diff the running total.
    const sqlite3_int64 changes_before = sqlite3_total_changes64(db_);

    const auto max_rows = static_cast<size_t>(options_.max_result_rows);
    while (true) {
        rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW) {
            if (timed_out_) {
                LogWarn("store", "Query timed out");
                return R::Err(timeout_error());
            }
            return R::Err(StoreError(op));
        }
        if (result.rows.size() >= max_rows) {
            return R::Err(Error::Make(ErrorKind::ResultTooLarge, op,
                "Result exceeds the limit of " + std::to_string(max_rows) +
                " rows; add a LIMIT or narrow the query"));
        }
        Row row;
        row.reserve(static_cast<size_t>(column_count));
        for (int c = 0; c < column_count; ++c) {
            row.push_back(ReadColumn(stmt.get(), c));
        }
        result.rows.push_back(std::move(row));
    }

    if (mode == ExecutionMode::ReadWrite) {
        result.affected_rows =
            static_cast<int64_t>(sqlite3_total_changes64(db_) - changes_before);
    }

    stmt.reset();
    if (txn.Commit() != SQLITE_OK) {
        return R::Err(StoreError(op));
    }

    LogDebug("store", op + " returned " + std::to_string(result.rows.size()) + " rows");
    return R::Ok(std::move(result));
}

} // namespace cashlog
