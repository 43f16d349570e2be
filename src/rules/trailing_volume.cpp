#include <cashlog/rules/trailing_volume.hpp>

#include "rule_utils.hpp"

namespace cashlog {

namespace {

const char* kTrailingVolumeSql =
    "SELECT l.location_id, l.name, l.avg_daily_cash_volume, "
    "       COUNT(d.id), COALESCE(SUM(d.amount), 0) "
    "FROM locations l "
    "LEFT JOIN deposits d ON d.location_id = l.location_id "
    "     AND d.deposit_date BETWEEN ? AND ? "
    "GROUP BY l.location_id, l.name, l.avg_daily_cash_volume "
    "ORDER BY l.location_id";

} // anonymous namespace

Result<std::vector<LocationVolume>, Error> TrailingDailyVolumes(
    IQueryExecutor& executor,
    const CivilDate& as_of,
    const RuleConfig& config) {
    using namespace rule_utils;

    const int window = config.trailing_volume_days > 0 ? config.trailing_volume_days : 1;
    // deposit_date may carry a time suffix; compare against the end of day.
    const auto first = as_of.AddDays(-(window - 1)).ToString();
    const auto last = as_of.ToString() + "~";

    auto result = executor.Execute(kTrailingVolumeSql, ExecutionMode::ReadOnly,
                                   {Value{first}, Value{last}});
    if (result.IsErr()) {
        return Propagate<std::vector<LocationVolume>>(result.Error(),
                                                      "TrailingDailyVolumes");
    }

    std::vector<LocationVolume> volumes;
    volumes.reserve(result.Value().rows.size());
    for (const auto& row : result.Value().rows) {
        LocationVolume v;
        v.location_id = TextAt(row, 0);
        v.name = TextAt(row, 1);
        if (IntAt(row, 3) > 0) {
            v.daily_volume = NumberAt(row, 4) / window;
            v.from_deposits = true;
        } else {
            v.daily_volume = NumberAt(row, 2);
        }
        volumes.push_back(std::move(v));
    }
    return Result<std::vector<LocationVolume>, Error>::Ok(std::move(volumes));
}

} // namespace cashlog
