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
// MissedPickup — a scheduled occurrence with no completed outcome.
// ---------------------------------------------------------------------------
struct MissedPickup {
    std::string location_id;
    std::string location_name;
    std::string carrier_id;
    CivilDate scheduled_date;
    std::string scheduled_time;                 // HH:MM
    std::optional<std::string> recorded_status; // "missed", "late" or no row
    int64_t days_elapsed = 0;
    double trailing_daily_volume = 0.0;
    double cash_at_risk = 0.0;
};

// ---------------------------------------------------------------------------
// DetectMissedPickups — scheduled (location, date) pairs in `range` without
// a 'completed' scheduled_pickups row.
//
// Days elapsed counts from the latest completed pickup inside the range, or
// from the day before range.start when there is none. Cash at risk is the
// trailing average daily deposit as of range.end times days elapsed.
// Ordered by date, then location id.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::vector<MissedPickup>, Error> DetectMissedPickups(
    IQueryExecutor& executor,
    const DateRange& range,
    const RuleConfig& config);

} // namespace cashlog
