#include <cashlog/rules/schedule_mismatch.hpp>

#include <cashlog/rules/trailing_volume.hpp>

#include "rule_utils.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace cashlog {

namespace {

// strftime('%w') counts from Sunday; the store counts from Monday.
const char* kDepositsByWeekdaySql =
    "SELECT location_id, "
    "       (CAST(strftime('%w', substr(deposit_date, 1, 10)) AS INTEGER) + 6) % 7 AS weekday, "
    "       SUM(amount) "
    "FROM deposits "
    "WHERE deposit_date BETWEEN ? AND ? "
    "GROUP BY location_id, weekday";

const char* kScheduleDaysSql =
    "SELECT DISTINCT location_id, day_of_week "
    "FROM pickup_schedules "
    "WHERE active = 1 "
    "ORDER BY location_id, day_of_week";

} // anonymous namespace

std::optional<int> PeakWeekday(const std::array<double, 7>& totals) {
    std::optional<int> peak;
    for (int day = 0; day < 7; ++day) {
        if (totals[day] <= 0.0) continue;
        if (!peak || totals[day] > totals[*peak]) peak = day;
    }
    return peak;
}

std::optional<int> NearestWeekday(const std::vector<int>& weekdays, int target) {
    std::optional<int> nearest;
    std::vector<int> sorted = weekdays;
    std::sort(sorted.begin(), sorted.end());
    for (int day : sorted) {
        if (!nearest ||
            rule_utils::CircularDayDistance(day, target) <
                rule_utils::CircularDayDistance(*nearest, target)) {
            nearest = day;
        }
    }
    return nearest;
}

Result<std::vector<ScheduleMismatch>, Error> DetectScheduleMismatches(
    IQueryExecutor& executor,
    const CivilDate& as_of,
    const RuleConfig& config) {
    using namespace rule_utils;
    using R = Result<std::vector<ScheduleMismatch>, Error>;
    constexpr const char* kRule = "DetectScheduleMismatches";

    auto volumes = TrailingDailyVolumes(executor, as_of, config);
    if (volumes.IsErr()) return Propagate<std::vector<ScheduleMismatch>>(volumes.Error(), kRule);

    const int history = config.deposit_history_days > 0 ? config.deposit_history_days : 1;
    auto deposit_rows = executor.Execute(kDepositsByWeekdaySql, ExecutionMode::ReadOnly,
        {Value{as_of.AddDays(-(history - 1)).ToString()},
         Value{as_of.ToString() + "~"}});
    if (deposit_rows.IsErr()) {
        return Propagate<std::vector<ScheduleMismatch>>(deposit_rows.Error(), kRule);
    }

    std::map<std::string, std::array<double, 7>> deposits;
    for (const auto& row : deposit_rows.Value().rows) {
        if (IsNull(row[1])) continue;
        const auto weekday = IntAt(row, 1);
        if (weekday < 0 || weekday > 6) continue;
        deposits[TextAt(row, 0)][static_cast<size_t>(weekday)] += NumberAt(row, 2);
    }

    auto schedule_rows = executor.Execute(kScheduleDaysSql, ExecutionMode::ReadOnly);
    if (schedule_rows.IsErr()) {
        return Propagate<std::vector<ScheduleMismatch>>(schedule_rows.Error(), kRule);
    }

    std::map<std::string, std::vector<int>> pickup_days;
    for (const auto& row : schedule_rows.Value().rows) {
        pickup_days[TextAt(row, 0)].push_back(static_cast<int>(IntAt(row, 1)));
    }

    std::vector<ScheduleMismatch> mismatches;
    for (const auto& v : volumes.Value()) {
        ScheduleMismatch m;
        m.location_id = v.location_id;
        m.location_name = v.name;
        m.daily_volume = v.daily_volume;

        auto dep_it = deposits.find(v.location_id);
        if (dep_it != deposits.end()) m.deposits_by_weekday = dep_it->second;
        auto day_it = pickup_days.find(v.location_id);
        if (day_it != pickup_days.end()) m.pickup_weekdays = day_it->second;

        m.peak_deposit_day = PeakWeekday(m.deposits_by_weekday);
        if (m.peak_deposit_day) {
            m.peak_pickup_day = NearestWeekday(m.pickup_weekdays, *m.peak_deposit_day);
        }
        if (m.peak_deposit_day && m.peak_pickup_day) {
            m.peak_day_distance = CircularDayDistance(*m.peak_deposit_day,
                                                      *m.peak_pickup_day);
            m.peak_day_mismatch = *m.peak_day_distance > config.peak_day_tolerance_days;
        }

        const auto frequency = static_cast<int>(m.pickup_weekdays.size());
        m.over_serviced = m.daily_volume < config.low_volume_threshold &&
                          frequency >= config.over_service_min_pickups;
        m.under_serviced = m.daily_volume >= config.high_volume_threshold &&
                           frequency <= config.under_service_max_pickups;

        if (m.peak_day_mismatch || m.over_serviced || m.under_serviced) {
            mismatches.push_back(std::move(m));
        }
    }

    LogInfo("rules", std::string(kRule) + ": " + std::to_string(mismatches.size()) +
            " locations flagged as of " + as_of.ToString());
    return R::Ok(std::move(mismatches));
}

} // namespace cashlog
