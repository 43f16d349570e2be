#include <cashlog/rules/findings.hpp>

#include "rule_utils.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace cashlog {

namespace {

std::string Dollars(double amount) {
    std::ostringstream os;
    os << '$' << std::fixed << std::setprecision(0) << amount;
    return os.str();
}

std::string Plural(int64_t n, const char* word) {
    return std::to_string(n) + " " + word + (n == 1 ? "" : "s");
}

} // anonymous namespace

const char* FindingKindName(FindingKind kind) {
    switch (kind) {
        case FindingKind::MissedPickup: return "missed-pickup";
        case FindingKind::HighRisk: return "high-risk";
        case FindingKind::ScheduleMismatch: return "schedule-mismatch";
        case FindingKind::ConsolidationOpportunity: return "consolidation-opportunity";
    }
    return "unknown";
}

const char* SeverityName(Severity severity) {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

Finding ToFinding(const MissedPickup& missed, const RuleConfig& config) {
    Finding f;
    f.location_id = missed.location_id;
    f.kind = FindingKind::MissedPickup;
    f.cash_at_risk = missed.cash_at_risk;
    f.severity = missed.cash_at_risk >= 2.0 * config.high_volume_threshold
        ? Severity::Critical : Severity::High;

    std::ostringstream os;
    os << "Pickup scheduled " << missed.scheduled_date.ToString() << " "
       << missed.scheduled_time << " at " << missed.location_name << " ("
       << missed.location_id << ") was "
       << (missed.recorded_status == std::optional<std::string>("late")
               ? "late" : "not completed")
       << "; " << Plural(missed.days_elapsed, "day") << " of deposits, "
       << Dollars(missed.cash_at_risk) << " at risk";
    f.summary = os.str();
    return f;
}

Finding ToFinding(const RiskScore& score) {
    Finding f;
    f.location_id = score.location_id;
    f.kind = FindingKind::HighRisk;
    f.cash_at_risk = score.cash_at_risk;
    f.severity = score.high_volume_overdue && score.cash_sitting_too_long
        ? Severity::Critical : Severity::High;

    std::ostringstream os;
    os << score.location_name << " (" << score.location_id << ") ";
    if (score.days_since_pickup) {
        os << "last picked up " << Plural(*score.days_since_pickup, "day") << " ago";
    } else {
        os << "has no completed pickup on record";
    }
    os << " at " << Dollars(score.daily_volume) << "/day; "
       << Dollars(score.cash_at_risk) << " estimated on site";
    f.summary = os.str();
    return f;
}

Finding ToFinding(const ScheduleMismatch& mismatch) {
    Finding f;
    f.location_id = mismatch.location_id;
    f.kind = FindingKind::ScheduleMismatch;
    f.severity = mismatch.under_serviced ? Severity::Medium : Severity::Low;

    std::vector<std::string> parts;
    if (mismatch.peak_day_mismatch) {
        parts.push_back(std::string("deposits peak on ") +
                        WeekdayName(*mismatch.peak_deposit_day) +
                        " but the nearest pickup is " +
                        WeekdayName(*mismatch.peak_pickup_day));
    }
    if (mismatch.under_serviced) {
        parts.push_back("under-serviced at " + Dollars(mismatch.daily_volume) + "/day with " +
                        Plural(static_cast<int64_t>(mismatch.pickup_weekdays.size()),
                               "pickup") + " a week");
    }
    if (mismatch.over_serviced) {
        parts.push_back("over-serviced at " + Dollars(mismatch.daily_volume) + "/day with " +
                        Plural(static_cast<int64_t>(mismatch.pickup_weekdays.size()),
                               "pickup") + " a week");
    }

    std::string summary = mismatch.location_name + " (" + mismatch.location_id + "): ";
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) summary += "; ";
        summary += parts[i];
    }
    f.summary = std::move(summary);
    return f;
}

std::vector<Finding> ToFindings(const ConsolidationOpportunity& op) {
    std::string members;
    for (const auto& stop : op.stops) {
        if (!members.empty()) members += ", ";
        members += stop.location_id + "@" + stop.scheduled_time;
    }

    std::vector<Finding> findings;
    for (const auto& stop : op.stops) {
        Finding f;
        f.location_id = stop.location_id;
        f.kind = FindingKind::ConsolidationOpportunity;
        f.severity = Severity::Low;
        f.summary = "Carrier " + op.carrier_id + " serves " +
                    Plural(static_cast<int64_t>(op.stops.size()), "stop") + " on " +
                    WeekdayName(op.weekday) + " at " +
                    Plural(op.distinct_times, "different time") + ": " + members;
        findings.push_back(std::move(f));
    }
    return findings;
}

void SortFindings(std::vector<Finding>& findings) {
    std::stable_sort(findings.begin(), findings.end(),
        [](const Finding& a, const Finding& b) {
            if (a.severity != b.severity) return a.severity > b.severity;
            return a.location_id < b.location_id;
        });
}

Result<std::vector<Finding>, Error> CollectFindings(
    IQueryExecutor& executor,
    const DateRange& range,
    const RuleConfig& config) {
    using rule_utils::Propagate;
    constexpr const char* kRule = "CollectFindings";

    std::vector<Finding> findings;

    auto missed = DetectMissedPickups(executor, range, config);
    if (missed.IsErr()) return Propagate<std::vector<Finding>>(missed.Error(), kRule);
    for (const auto& m : missed.Value()) findings.push_back(ToFinding(m, config));

    auto risk = ScoreRisk(executor, range.end, config);
    if (risk.IsErr()) return Propagate<std::vector<Finding>>(risk.Error(), kRule);
    for (const auto& s : risk.Value()) {
        if (s.high_risk) findings.push_back(ToFinding(s));
    }

    auto mismatches = DetectScheduleMismatches(executor, range.end, config);
    if (mismatches.IsErr()) return Propagate<std::vector<Finding>>(mismatches.Error(), kRule);
    for (const auto& m : mismatches.Value()) findings.push_back(ToFinding(m));

    auto consolidation = FindConsolidationOpportunities(executor, config);
    if (consolidation.IsErr()) {
        return Propagate<std::vector<Finding>>(consolidation.Error(), kRule);
    }
    for (const auto& op : consolidation.Value()) {
        for (auto& f : ToFindings(op)) findings.push_back(std::move(f));
    }

    SortFindings(findings);
    LogInfo("rules", std::string(kRule) + ": " + std::to_string(findings.size()) +
            " findings");
    return Result<std::vector<Finding>, Error>::Ok(std::move(findings));
}

} // namespace cashlog
