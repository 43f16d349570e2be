#include <cashlog/rules/missed_pickups.hpp>

#include <cashlog/rules/trailing_volume.hpp>

#include "rule_utils.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace cashlog {

namespace {

const char* kActiveSchedulesSql =
    "SELECT s.location_id, s.carrier_id, s.day_of_week, s.scheduled_time "
    "FROM pickup_schedules s "
    "WHERE s.active = 1 "
    "ORDER BY s.location_id, s.day_of_week, s.scheduled_time, s.id";

const char* kOutcomesSql =
    "SELECT location_id, scheduled_date, status "
    "FROM scheduled_pickups "
    "WHERE scheduled_date BETWEEN ? AND ? "
    "ORDER BY location_id, scheduled_date";

struct Schedule {
    std::string location_id;
    std::string carrier_id;
    int weekday = 0;
    std::string time;
};

struct Outcomes {
    std::set<CivilDate> completed;
    std::map<CivilDate, std::set<std::string>> statuses;
};

std::optional<std::string> RecordedStatus(const Outcomes* outcomes,
                                          const CivilDate& date) {
    if (outcomes == nullptr) return std::nullopt;
    auto it = outcomes->statuses.find(date);
    if (it == outcomes->statuses.end()) return std::nullopt;
    if (it->second.count("missed")) return std::string("missed");
    if (it->second.count("late")) return std::string("late");
    return std::nullopt;
}

} // anonymous namespace

Result<std::vector<MissedPickup>, Error> DetectMissedPickups(
    IQueryExecutor& executor,
    const DateRange& range,
    const RuleConfig& config) {
    using namespace rule_utils;
    using R = Result<std::vector<MissedPickup>, Error>;
    constexpr const char* kRule = "DetectMissedPickups";

    auto volumes = TrailingDailyVolumes(executor, range.end, config);
    if (volumes.IsErr()) return Propagate<std::vector<MissedPickup>>(volumes.Error(), kRule);

    std::map<std::string, const LocationVolume*> by_location;
    for (const auto& v : volumes.Value()) {
        by_location[v.location_id] = &v;
    }

    auto schedule_rows = executor.Execute(kActiveSchedulesSql, ExecutionMode::ReadOnly);
    if (schedule_rows.IsErr()) {
        return Propagate<std::vector<MissedPickup>>(schedule_rows.Error(), kRule);
    }

    std::vector<Schedule> schedules;
    for (const auto& row : schedule_rows.Value().rows) {
        schedules.push_back({TextAt(row, 0), TextAt(row, 1),
                             static_cast<int>(IntAt(row, 2)), TextAt(row, 3)});
    }

    auto outcome_rows = executor.Execute(kOutcomesSql, ExecutionMode::ReadOnly,
        {Value{range.start.ToString()}, Value{range.end.ToString() + "~"}});
    if (outcome_rows.IsErr()) {
        return Propagate<std::vector<MissedPickup>>(outcome_rows.Error(), kRule);
    }

    std::map<std::string, Outcomes> outcomes;
    for (const auto& row : outcome_rows.Value().rows) {
        auto date = DateAt(row, 1, kRule);
        if (!date) continue;
        auto& entry = outcomes[TextAt(row, 0)];
        auto status = TextAt(row, 2);
        if (status == "completed") entry.completed.insert(*date);
        entry.statuses[*date].insert(status);
    }

    std::vector<MissedPickup> missed;
    for (CivilDate day = range.start; day <= range.end; day = day.AddDays(1)) {
        std::set<std::string> seen;
        for (const auto& s : schedules) {
            if (s.weekday != day.Weekday()) continue;
            // Several schedules for one (location, date) yield one record;
            // the earliest scheduled time wins.
            if (!seen.insert(s.location_id).second) continue;

            const auto out_it = outcomes.find(s.location_id);
            const Outcomes* loc_outcomes =
                out_it == outcomes.end() ? nullptr : &out_it->second;
            if (loc_outcomes && loc_outcomes->completed.count(day)) continue;

            CivilDate anchor = range.start.AddDays(-1);
            if (loc_outcomes) {
                auto it = loc_outcomes->completed.lower_bound(day);
                if (it != loc_outcomes->completed.begin()) {
                    --it;
                    if (*it >= range.start) anchor = *it;
                }
            }

            MissedPickup m;
            m.location_id = s.location_id;
            m.carrier_id = s.carrier_id;
            m.scheduled_date = day;
            m.scheduled_time = s.time;
            m.recorded_status = RecordedStatus(loc_outcomes, day);
            m.days_elapsed = day - anchor;
            auto vol_it = by_location.find(s.location_id);
            if (vol_it != by_location.end()) {
                m.location_name = vol_it->second->name;
                m.trailing_daily_volume = vol_it->second->daily_volume;
            }
            m.cash_at_risk = m.trailing_daily_volume * static_cast<double>(m.days_elapsed);
            missed.push_back(std::move(m));
        }
    }

    std::stable_sort(missed.begin(), missed.end(),
        [](const MissedPickup& a, const MissedPickup& b) {
            if (a.scheduled_date != b.scheduled_date) {
                return a.scheduled_date < b.scheduled_date;
            }
            return a.location_id < b.location_id;
        });

    LogInfo("rules", std::string(kRule) + ": " + std::to_string(missed.size()) +
            " missed pickups between " + range.start.ToString() + " and " +
            range.end.ToString());
    return R::Ok(std::move(missed));
}

} // namespace cashlog
