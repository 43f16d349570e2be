#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cashlog {

struct Blob {
    std::vector<uint8_t> bytes;

    bool operator==(const Blob& other) const { return bytes == other.bytes; }
    bool operator!=(const Blob& other) const { return bytes != other.bytes; }
};

// One SQLite cell: NULL, INTEGER, REAL, TEXT or BLOB.
using Value = std::variant<std::monostate, int64_t, double, std::string, Blob>;

using Row = std::vector<Value>;

struct QueryResult {
    std::vector<std::string> columns;
    std::vector<Row> rows;
    // Set for ReadWrite executions: rows changed by the statement.
    std::optional<int64_t> affected_rows;
};

inline bool IsNull(const Value& v) {
    return std::holds_alternative<std::monostate>(v);
}

// Numeric view of a cell; INTEGER and REAL both convert, anything else is nullopt.
inline std::optional<double> AsDouble(const Value& v) {
    if (const auto* i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
    if (const auto* d = std::get_if<double>(&v)) return *d;
    return std::nullopt;
}

inline std::optional<int64_t> AsInt(const Value& v) {
    if (const auto* i = std::get_if<int64_t>(&v)) return *i;
    if (const auto* d = std::get_if<double>(&v)) return static_cast<int64_t>(*d);
    return std::nullopt;
}

inline std::optional<std::string> AsText(const Value& v) {
    if (const auto* s = std::get_if<std::string>(&v)) return *s;
    if (const auto* i = std::get_if<int64_t>(&v)) return std::to_string(*i);
    return std::nullopt;
}

} // namespace cashlog
