#pragma once

#include <cashlog/core/result.hpp>
#include <cashlog/rules/rule_config.hpp>
#include <cashlog/store/i_query_executor.hpp>

#include <optional>
#include <string>
#include <vector>

namespace cashlog {

struct ConsolidationStop {
    std::string location_id;
    std::string location_name;
    std::string scheduled_time;
    std::optional<double> latitude;
    std::optional<double> longitude;
};

// ---------------------------------------------------------------------------
// ConsolidationOpportunity — stops one carrier serves on the same weekday at
// different times, which could be merged into fewer runs.
// ---------------------------------------------------------------------------
struct ConsolidationOpportunity {
    std::string carrier_id;
    std::string carrier_name;
    int weekday = 0;                        // 0=Monday
    std::vector<ConsolidationStop> stops;   // ordered by location id
    int distinct_times = 0;
    bool distance_gated = false;            // clustered by coordinates
    std::optional<double> max_distance_km;  // widest pair in the group
};

/// Great-circle distance in kilometres (haversine, mean Earth radius).
[[nodiscard]] double HaversineKm(double lat1, double lon1, double lat2, double lon2);

// ---------------------------------------------------------------------------
// FindConsolidationOpportunities — active schedules grouped by (carrier,
// weekday); a group qualifies with two or more locations and two or more
// distinct scheduled times.
//
// When locations has latitude/longitude columns, each group is first split
// into single-linkage clusters no wider than consolidation_max_distance_km
// per link, dropping stops without coordinates. Ordered by carrier, weekday
// and first location id.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::vector<ConsolidationOpportunity>, Error>
FindConsolidationOpportunities(IQueryExecutor& executor, const RuleConfig& config);

} // namespace cashlog
