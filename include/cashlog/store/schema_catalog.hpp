#pragma once

#include <cashlog/core/result.hpp>
#include <cashlog/core/types.hpp>
#include <cashlog/store/i_query_executor.hpp>

#include <optional>
#include <string>
#include <vector>

namespace cashlog {

// ---------------------------------------------------------------------------
// ColumnInfo — one column of a table as declared in the live schema.
// ---------------------------------------------------------------------------
struct ColumnInfo {
    std::string name;
    std::string declared_type;              // as written in CREATE TABLE, may be empty
    bool nullable = true;
    int primary_key_position = 0;           // 0 = not part of the primary key
    std::optional<std::string> default_value;
};

// ---------------------------------------------------------------------------
// ListTables — user tables in ascending name order.
//
// Internal sqlite_* tables are excluded. Reads the live schema on every call.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::vector<std::string>, Error> ListTables(
    IQueryExecutor& executor);

// ---------------------------------------------------------------------------
// DescribeTable — columns of one table in declaration order.
//
// Uses pragma_table_info() through the read-only path. NotFound when the
// table does not exist.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::vector<ColumnInfo>, Error> DescribeTable(
    IQueryExecutor& executor,
    const TableName& table);

// True when `table` exists and declares `column` (case-insensitive).
[[nodiscard]] Result<bool, Error> HasColumn(
    IQueryExecutor& executor,
    const TableName& table,
    const std::string& column);

} // namespace cashlog
