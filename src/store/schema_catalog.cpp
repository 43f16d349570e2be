#include <cashlog/store/schema_catalog.hpp>

#include <cashlog/core/log.hpp>

#include <cctype>

namespace cashlog {

namespace {

const char* kListTablesSql =
    "SELECT name FROM sqlite_master "
    "WHERE type = 'table' AND name NOT LIKE 'sqlite\\_%' ESCAPE '\\' "
    "ORDER BY name";

const char* kTableInfoSql =
    "SELECT name, type, \"notnull\", dflt_value, pk "
    "FROM pragma_table_info(?) ORDER BY cid";

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

Result<std::vector<std::string>, Error> ListTables(IQueryExecutor& executor) {
    auto result = executor.Execute(kListTablesSql, ExecutionMode::ReadOnly);
    if (result.IsErr()) {
        return Result<std::vector<std::string>, Error>::Err(std::move(result).Error());
    }

    std::vector<std::string> tables;
    for (const auto& row : result.Value().rows) {
        if (row.empty()) continue;
        if (auto name = AsText(row[0])) {
            tables.push_back(*name);
        }
    }
    LogDebug("store", "ListTables: " + std::to_string(tables.size()) + " tables");
    return Result<std::vector<std::string>, Error>::Ok(std::move(tables));
}

Result<std::vector<ColumnInfo>, Error> DescribeTable(
    IQueryExecutor& executor,
    const TableName& table) {
    using R = Result<std::vector<ColumnInfo>, Error>;

    auto result = executor.Execute(kTableInfoSql, ExecutionMode::ReadOnly,
                                   {Value{table.Value()}});
    if (result.IsErr()) {
        return R::Err(std::move(result).Error());
    }

    const auto& rows = result.Value().rows;
    if (rows.empty()) {
        return R::Err(Error::Make(ErrorKind::NotFound, "DescribeTable",
                                  "Table '" + table.Value() + "' does not exist"));
    }

    std::vector<ColumnInfo> columns;
    columns.reserve(rows.size());
    for (const auto& row : rows) {
        ColumnInfo col;
        col.name = AsText(row[0]).value_or("");
        col.declared_type = AsText(row[1]).value_or("");
        col.nullable = AsInt(row[2]).value_or(0) == 0;
        if (!IsNull(row[3])) {
            col.default_value = AsText(row[3]);
            if (!col.default_value) {
                if (auto d = AsDouble(row[3])) col.default_value = std::to_string(*d);
            }
        }
        col.primary_key_position = static_cast<int>(AsInt(row[4]).value_or(0));
        columns.push_back(std::move(col));
    }
    return R::Ok(std::move(columns));
}

Result<bool, Error> HasColumn(
    IQueryExecutor& executor,
    const TableName& table,
    const std::string& column) {
    auto columns = DescribeTable(executor, table);
    if (columns.IsErr()) {
        if (columns.Error().kind == ErrorKind::NotFound) {
            return Result<bool, Error>::Ok(false);
        }
        return Result<bool, Error>::Err(std::move(columns).Error());
    }
    for (const auto& col : columns.Value()) {
        if (EqualsIgnoreCase(col.name, column)) {
            return Result<bool, Error>::Ok(true);
        }
    }
    return Result<bool, Error>::Ok(false);
}

} // namespace cashlog
