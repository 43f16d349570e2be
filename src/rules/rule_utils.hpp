#pragma once

#include <cashlog/core/log.hpp>
#include <cashlog/core/result.hpp>
#include <cashlog/core/types.hpp>
#include <cashlog/store/value.hpp>

#include <cstdlib>
#include <optional>
#include <string>

namespace cashlog::rule_utils {

inline std::string TextAt(const Row& row, size_t col) {
    if (col >= row.size()) return {};
    return AsText(row[col]).value_or("");
}

inline double NumberAt(const Row& row, size_t col) {
    if (col >= row.size()) return 0.0;
    return AsDouble(row[col]).value_or(0.0);
}

inline int64_t IntAt(const Row& row, size_t col) {
    if (col >= row.size()) return 0;
    return AsInt(row[col]).value_or(0);
}

// Dates are stored as TEXT; rows with unparsable dates are skipped with a
// warning rather than failing the whole rule.
inline std::optional<CivilDate> DateAt(const Row& row, size_t col,
                                       const char* rule) {
    if (col >= row.size() || IsNull(row[col])) return std::nullopt;
    auto text = TextAt(row, col);
    // Accept "YYYY-MM-DD" with a trailing time component.
    auto parsed = CivilDate::Create(text.substr(0, 10));
    if (parsed.IsErr()) {
        LogWarn("rules", std::string(rule) + ": skipping row with bad date '" +
                text + "'");
        return std::nullopt;
    }
    return parsed.Value();
}

// Distance between two weekdays going either way round the week (0..3).
inline int CircularDayDistance(int a, int b) {
    int d = std::abs(a - b) % 7;
    return d > 3 ? 7 - d : d;
}

template <typename T>
Result<T, Error> Propagate(const Error& error, const char* rule) {
    LogWarn("rules", std::string(rule) + " failed: " + error.ToString());
    return Result<T, Error>::Err(error);
}

} // namespace cashlog::rule_utils
