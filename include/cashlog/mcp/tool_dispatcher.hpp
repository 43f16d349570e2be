#pragma once

#include <cashlog/core/result.hpp>
#include <cashlog/mcp/tool_call.hpp>
#include <cashlog/store/i_query_executor.hpp>

#include <nlohmann/json.hpp>

namespace cashlog {

// JSON form of one cell: null, integer, real, text, or a hex string for blobs.
[[nodiscard]] nlohmann::json CellToJson(const Value& value);

// {"columns": [...], "rows": [[...]], "row_count": n[, "affected_rows": n]}
[[nodiscard]] nlohmann::json QueryResultToJson(const QueryResult& result);

// ---------------------------------------------------------------------------
// ToolDispatcher — executes typed tool calls against the store.
//
// Holds the executor by reference; single-threaded, one executor shared by
// every call for the server lifetime.
// ---------------------------------------------------------------------------
class ToolDispatcher {
public:
    explicit ToolDispatcher(IQueryExecutor& executor) : executor_(executor) {}

    [[nodiscard]] Result<nlohmann::json, Error> Dispatch(const ToolCall& call);

private:
    IQueryExecutor& executor_;
};

} // namespace cashlog
