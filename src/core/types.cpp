#include <cashlog/core/types.hpp>

#include <cstdio>

namespace cashlog {

namespace {

// Civil-from-days / days-from-civil after H. Hinnant's chrono algorithms.
int64_t DaysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

struct Ymd {
    int64_t year;
    unsigned month;
    unsigned day;
};

Ymd CivilFromDays(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return {y + (m <= 2), m, d};
}

bool IsLeap(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned DaysInMonth(int64_t y, unsigned m) {
    static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && IsLeap(y)) return 29;
    return kDays[m - 1];
}

// Parse exactly `width` ASCII digits starting at `pos`.
bool ParseDigits(std::string_view s, size_t pos, size_t width, unsigned& out) {
    if (pos + width > s.size()) return false;
    out = 0;
    for (size_t i = pos; i < pos + width; ++i) {
        if (s[i] < '0' || s[i] > '9') return false;
        out = out * 10 + static_cast<unsigned>(s[i] - '0');
    }
    return true;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// TableName
// ---------------------------------------------------------------------------
Result<TableName, std::string> TableName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<TableName, std::string>::Err("Table name must not be empty");
    }
    if (name.size() > 128) {
        return Result<TableName, std::string>::Err(
            "Table name must be at most 128 bytes, got " +
            std::to_string(name.size()));
    }
    for (char c : name) {
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
            return Result<TableName, std::string>::Err(
                "Table name must not contain control characters");
        }
    }
    return Result<TableName, std::string>::Ok(TableName(std::string(name)));
}

// ---------------------------------------------------------------------------
// CivilDate
// ---------------------------------------------------------------------------
Result<CivilDate, std::string> CivilDate::Create(std::string_view iso) {
    unsigned y = 0, m = 0, d = 0;
    if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-' ||
        !ParseDigits(iso, 0, 4, y) || !ParseDigits(iso, 5, 2, m) ||
        !ParseDigits(iso, 8, 2, d)) {
        return Result<CivilDate, std::string>::Err(
            "Date must have the form YYYY-MM-DD, got '" + std::string(iso) + "'");
    }
    if (m < 1 || m > 12) {
        return Result<CivilDate, std::string>::Err(
            "Month out of range in '" + std::string(iso) + "'");
    }
    if (d < 1 || d > DaysInMonth(y, m)) {
        return Result<CivilDate, std::string>::Err(
            "Day out of range in '" + std::string(iso) + "'");
    }
    return Result<CivilDate, std::string>::Ok(CivilDate(DaysFromCivil(y, m, d)));
}

CivilDate CivilDate::FromYmd(int year, unsigned month, unsigned day) {
    return CivilDate(DaysFromCivil(year, month, day));
}

int CivilDate::Weekday() const noexcept {
    // 1970-01-01 was a Thursday (3 with Monday = 0).
    const int64_t w = (days_ + 3) % 7;
    return static_cast<int>(w < 0 ? w + 7 : w);
}

std::string CivilDate::ToString() const {
    const auto ymd = CivilFromDays(days_);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u",
                  static_cast<long long>(ymd.year), ymd.month, ymd.day);
    return buf;
}

// ---------------------------------------------------------------------------
// YearMonth
// ---------------------------------------------------------------------------
Result<YearMonth, std::string> YearMonth::Create(std::string_view iso) {
    unsigned y = 0, m = 0;
    if (iso.size() != 7 || iso[4] != '-' ||
        !ParseDigits(iso, 0, 4, y) || !ParseDigits(iso, 5, 2, m)) {
        return Result<YearMonth, std::string>::Err(
            "Month must have the form YYYY-MM, got '" + std::string(iso) + "'");
    }
    if (m < 1 || m > 12) {
        return Result<YearMonth, std::string>::Err(
            "Month out of range in '" + std::string(iso) + "'");
    }
    return Result<YearMonth, std::string>::Ok(YearMonth(static_cast<int>(y), m));
}

std::string YearMonth::ToString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u", year_, month_);
    return buf;
}

// ---------------------------------------------------------------------------
// DateRange
// ---------------------------------------------------------------------------
Result<DateRange, std::string> DateRange::Create(CivilDate start, CivilDate end) {
    if (end < start) {
        return Result<DateRange, std::string>::Err(
            "Range end " + end.ToString() + " is before start " + start.ToString());
    }
    return Result<DateRange, std::string>::Ok(DateRange{start, end});
}

const char* WeekdayName(int weekday) {
    switch (weekday) {
        case 0: return "Monday";
        case 1: return "Tuesday";
        case 2: return "Wednesday";
        case 3: return "Thursday";
        case 4: return "Friday";
        case 5: return "Saturday";
        case 6: return "Sunday";
    }
    return "unknown";
}

} // namespace cashlog
