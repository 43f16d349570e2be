#include <cashlog/rules/risk_scoring.hpp>

#include <cashlog/rules/trailing_volume.hpp>

#include "rule_utils.hpp"

#include <map>

namespace cashlog {

namespace {

const char* kLastCompletedSql =
    "SELECT location_id, MAX(substr(scheduled_date, 1, 10)) "
    "FROM scheduled_pickups "
    "WHERE status = 'completed' AND scheduled_date <= ? "
    "GROUP BY location_id";

} // anonymous namespace

RiskScore ClassifyRisk(double daily_volume,
                       std::optional<int64_t> days,
                       const RuleConfig& config) {
    RiskScore score;
    score.daily_volume = daily_volume;
    score.days_since_pickup = days;

    if (!days) {
        score.high_volume_overdue = daily_volume >= config.high_volume_threshold;
        score.cash_sitting_too_long = true;
        score.high_risk = true;
        score.cash_at_risk = daily_volume * config.trailing_volume_days;
        return score;
    }

    score.high_volume_overdue =
        daily_volume >= config.high_volume_threshold && *days > 1;
    score.cash_sitting_too_long =
        static_cast<double>(*days) * 24.0 > config.cash_sitting_hours;
    score.high_risk = score.high_volume_overdue || score.cash_sitting_too_long;
    score.cash_at_risk = daily_volume * static_cast<double>(*days);
    return score;
}

Result<std::vector<RiskScore>, Error> ScoreRisk(
    IQueryExecutor& executor,
    const CivilDate& as_of,
    const RuleConfig& config) {
    using namespace rule_utils;
    constexpr const char* kRule = "ScoreRisk";

    auto volumes = TrailingDailyVolumes(executor, as_of, config);
    if (volumes.IsErr()) return Propagate<std::vector<RiskScore>>(volumes.Error(), kRule);

    auto rows = executor.Execute(kLastCompletedSql, ExecutionMode::ReadOnly,
                                 {Value{as_of.ToString() + "~"}});
    if (rows.IsErr()) return Propagate<std::vector<RiskScore>>(rows.Error(), kRule);

    std::map<std::string, CivilDate> last_completed;
    for (const auto& row : rows.Value().rows) {
        if (auto date = DateAt(row, 1, kRule)) {
            last_completed[TextAt(row, 0)] = *date;
        }
    }

    std::vector<RiskScore> scores;
    scores.reserve(volumes.Value().size());
    int high_risk = 0;
    for (const auto& v : volumes.Value()) {
        std::optional<int64_t> days;
        std::optional<CivilDate> last;
        auto it = last_completed.find(v.location_id);
        if (it != last_completed.end()) {
            last = it->second;
            days = as_of - it->second;
        }
        auto score = ClassifyRisk(v.daily_volume, days, config);
        score.location_id = v.location_id;
        score.location_name = v.name;
        score.last_pickup = last;
        if (score.high_risk) ++high_risk;
        scores.push_back(std::move(score));
    }

    LogInfo("rules", std::string(kRule) + ": " + std::to_string(high_risk) + " of " +
            std::to_string(scores.size()) + " locations at high risk as of " +
            as_of.ToString());
    return Result<std::vector<RiskScore>, Error>::Ok(std::move(scores));
}

} // namespace cashlog
