#pragma once

#include <cashlog/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace cashlog {

// ---------------------------------------------------------------------------
// TableName — a table identifier accepted by the schema catalog.
//
// Rules:
//   - Non-empty, max 128 bytes
//   - No ASCII control characters
// The name is always bound as a parameter, never spliced into SQL.
// ---------------------------------------------------------------------------
class TableName {
public:
    static Result<TableName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const TableName& other) const { return value_ == other.value_; }
    bool operator!=(const TableName& other) const { return value_ != other.value_; }

private:
    explicit TableName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// CivilDate — a proleptic Gregorian calendar date ("YYYY-MM-DD").
//
// Stored as days since 1970-01-01 so that date arithmetic is plain integer
// arithmetic. Weekday() follows the store convention: 0=Monday .. 6=Sunday.
// ---------------------------------------------------------------------------
class CivilDate {
public:
    CivilDate() = default;

    static Result<CivilDate, std::string> Create(std::string_view iso);
    static CivilDate FromYmd(int year, unsigned month, unsigned day);
    static CivilDate FromDays(int64_t days_since_epoch) {
        return CivilDate(days_since_epoch);
    }

    [[nodiscard]] int64_t DaysSinceEpoch() const noexcept { return days_; }
    [[nodiscard]] int Weekday() const noexcept;
    [[nodiscard]] std::string ToString() const;

    [[nodiscard]] CivilDate AddDays(int64_t n) const { return CivilDate(days_ + n); }

    friend int64_t operator-(const CivilDate& a, const CivilDate& b) {
        return a.days_ - b.days_;
    }
    bool operator==(const CivilDate& o) const { return days_ == o.days_; }
    bool operator!=(const CivilDate& o) const { return days_ != o.days_; }
    bool operator<(const CivilDate& o) const { return days_ < o.days_; }
    bool operator<=(const CivilDate& o) const { return days_ <= o.days_; }
    bool operator>(const CivilDate& o) const { return days_ > o.days_; }
    bool operator>=(const CivilDate& o) const { return days_ >= o.days_; }

private:
    explicit CivilDate(int64_t days) : days_(days) {}
    int64_t days_ = 0;
};

// ---------------------------------------------------------------------------
// YearMonth — a billing month ("YYYY-MM").
// ---------------------------------------------------------------------------
class YearMonth {
public:
    static Result<YearMonth, std::string> Create(std::string_view iso);

    [[nodiscard]] std::string ToString() const;

    bool operator==(const YearMonth& o) const {
        return year_ == o.year_ && month_ == o.month_;
    }
    bool operator!=(const YearMonth& o) const { return !(*this == o); }

private:
    YearMonth(int year, unsigned month) : year_(year), month_(month) {}
    int year_;
    unsigned month_;
};

// ---------------------------------------------------------------------------
// DateRange — inclusive [start, end] with start <= end.
// ---------------------------------------------------------------------------
struct DateRange {
    CivilDate start;
    CivilDate end;

    static Result<DateRange, std::string> Create(CivilDate start, CivilDate end);

    [[nodiscard]] int64_t Days() const { return (end - start) + 1; }
    [[nodiscard]] bool Contains(const CivilDate& d) const {
        return d >= start && d <= end;
    }
};

/// "Monday" .. "Sunday" for 0..6; "unknown" otherwise.
const char* WeekdayName(int weekday);

} // namespace cashlog
