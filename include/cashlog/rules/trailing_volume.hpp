#pragma once

#include <cashlog/core/result.hpp>
#include <cashlog/core/types.hpp>
#include <cashlog/rules/rule_config.hpp>
#include <cashlog/store/i_query_executor.hpp>

#include <string>
#include <vector>

namespace cashlog {

// ---------------------------------------------------------------------------
// LocationVolume — trailing average daily deposit for one location.
// ---------------------------------------------------------------------------
struct LocationVolume {
    std::string location_id;
    std::string name;
    double daily_volume = 0.0;
    bool from_deposits = false;   // false: fell back to avg_daily_cash_volume
};

// ---------------------------------------------------------------------------
// TrailingDailyVolumes — every location's trailing average as of `as_of`.
//
// Sum of deposits over the trailing_volume_days ending at `as_of`
// (inclusive) divided by trailing_volume_days. Locations without deposits in
// that window use their avg_daily_cash_volume column. Ordered by location id.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::vector<LocationVolume>, Error> TrailingDailyVolumes(
    IQueryExecutor& executor,
    const CivilDate& as_of,
    const RuleConfig& config);

} // namespace cashlog
