#pragma once

#include <cashlog/core/result.hpp>
#include <cashlog/core/types.hpp>
#include <cashlog/rules/rule_config.hpp>
#include <cashlog/store/i_query_executor.hpp>

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace cashlog {

// ---------------------------------------------------------------------------
// ScheduleMismatch — a location whose pickup pattern does not fit its
// deposit pattern. Weekdays are 0=Monday .. 6=Sunday.
// ---------------------------------------------------------------------------
struct ScheduleMismatch {
    std::string location_id;
    std::string location_name;
    double daily_volume = 0.0;
    std::array<double, 7> deposits_by_weekday{};
    std::vector<int> pickup_weekdays;        // distinct active schedule days
    std::optional<int> peak_deposit_day;     // absent without deposits
    std::optional<int> peak_pickup_day;      // absent without schedules
    std::optional<int> peak_day_distance;
    bool peak_day_mismatch = false;
    bool over_serviced = false;
    bool under_serviced = false;
};

// Weekday with the largest total; ties go to the earliest weekday. Empty
// when every total is zero.
[[nodiscard]] std::optional<int> PeakWeekday(const std::array<double, 7>& totals);

// Scheduled weekday circularly nearest `target`; ties go to the earlier
// weekday. Empty when `weekdays` is empty.
[[nodiscard]] std::optional<int> NearestWeekday(const std::vector<int>& weekdays,
                                                int target);

// ---------------------------------------------------------------------------
// DetectScheduleMismatches — locations with at least one flag, by id.
//
// Deposits are bucketed by weekday over deposit_history_days ending at
// `as_of`. Peak-day mismatch: peak pickup day more than
// peak_day_tolerance_days from the peak deposit day. Over-serviced: volume
// below low_volume_threshold with at least over_service_min_pickups weekly
// pickups. Under-serviced: volume at or above high_volume_threshold with at
// most under_service_max_pickups weekly pickups.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::vector<ScheduleMismatch>, Error> DetectScheduleMismatches(
    IQueryExecutor& executor,
    const CivilDate& as_of,
    const RuleConfig& config);

} // namespace cashlog
