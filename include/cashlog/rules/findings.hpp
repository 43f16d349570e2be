#pragma once

#include <cashlog/core/result.hpp>
#include <cashlog/core/types.hpp>
#include <cashlog/rules/consolidation.hpp>
#include <cashlog/rules/missed_pickups.hpp>
#include <cashlog/rules/risk_scoring.hpp>
#include <cashlog/rules/rule_config.hpp>
#include <cashlog/rules/schedule_mismatch.hpp>
#include <cashlog/store/i_query_executor.hpp>

#include <string>
#include <vector>

namespace cashlog {

enum class FindingKind {
    MissedPickup,
    HighRisk,
    ScheduleMismatch,
    ConsolidationOpportunity,
};

enum class Severity {
    Low,
    Medium,
    High,
    Critical,
};

/// "missed-pickup", "high-risk", "schedule-mismatch", "consolidation-opportunity".
const char* FindingKindName(FindingKind kind);

/// "low", "medium", "high", "critical".
const char* SeverityName(Severity severity);

// ---------------------------------------------------------------------------
// Finding — one alert/report record for a location.
// ---------------------------------------------------------------------------
struct Finding {
    std::string location_id;
    FindingKind kind = FindingKind::MissedPickup;
    Severity severity = Severity::Low;
    double cash_at_risk = 0.0;
    std::string summary;
};

// Conversions from individual rule results.
[[nodiscard]] Finding ToFinding(const MissedPickup& missed, const RuleConfig& config);
[[nodiscard]] Finding ToFinding(const RiskScore& score);
[[nodiscard]] Finding ToFinding(const ScheduleMismatch& mismatch);
[[nodiscard]] std::vector<Finding> ToFindings(const ConsolidationOpportunity& op);

// Critical first, then location id; ties keep their input order.
void SortFindings(std::vector<Finding>& findings);

// ---------------------------------------------------------------------------
// CollectFindings — missed pickups over `range`; risk, schedule mismatch and
// consolidation as of range.end. Only high-risk scores become findings.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::vector<Finding>, Error> CollectFindings(
    IQueryExecutor& executor,
    const DateRange& range,
    const RuleConfig& config);

} // namespace cashlog
