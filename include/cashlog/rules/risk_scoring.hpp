#pragma once

#include <cashlog/core/result.hpp>
#include <cashlog/core/types.hpp>
#include <cashlog/rules/rule_config.hpp>
#include <cashlog/store/i_query_executor.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cashlog {

// ---------------------------------------------------------------------------
// RiskScore — cash exposure of one location as of a date.
// ---------------------------------------------------------------------------
struct RiskScore {
    std::string location_id;
    std::string location_name;
    double daily_volume = 0.0;
    std::optional<CivilDate> last_pickup;
    std::optional<int64_t> days_since_pickup;  // absent when never picked up
    bool high_volume_overdue = false;   // volume >= threshold and days > 1
    bool cash_sitting_too_long = false; // days * 24 > cash_sitting_hours
    bool high_risk = false;
    double cash_at_risk = 0.0;
};

// Pure classification used by ScoreRisk. A location that was never picked
// up (`days` empty) is high risk and counts as sitting too long.
[[nodiscard]] RiskScore ClassifyRisk(double daily_volume,
                                     std::optional<int64_t> days,
                                     const RuleConfig& config);

// ---------------------------------------------------------------------------
// ScoreRisk — one score per location, ordered by location id.
//
// Days since the last completed pickup on or before `as_of`; volume is the
// trailing average daily deposit as of `as_of`.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::vector<RiskScore>, Error> ScoreRisk(
    IQueryExecutor& executor,
    const CivilDate& as_of,
    const RuleConfig& config);

} // namespace cashlog
