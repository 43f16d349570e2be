#include <cashlog/rules/consolidation.hpp>

#include <cashlog/store/schema_catalog.hpp>

#include "rule_utils.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <set>
#include <utility>

namespace cashlog {

namespace {

const char* kSchedulesSql =
    "SELECT s.carrier_id, COALESCE(c.name, ''), s.day_of_week, s.location_id, "
    "       COALESCE(l.name, ''), s.scheduled_time "
    "FROM pickup_schedules s "
    "LEFT JOIN carriers c ON c.carrier_id = s.carrier_id "
    "LEFT JOIN locations l ON l.location_id = s.location_id "
    "WHERE s.active = 1 "
    "ORDER BY s.carrier_id, s.day_of_week, s.location_id, s.scheduled_time";

const char* kSchedulesWithCoordinatesSql =
    "SELECT s.carrier_id, COALESCE(c.name, ''), s.day_of_week, s.location_id, "
    "       COALESCE(l.name, ''), s.scheduled_time, l.latitude, l.longitude "
    "FROM pickup_schedules s "
    "LEFT JOIN carriers c ON c.carrier_id = s.carrier_id "
    "LEFT JOIN locations l ON l.location_id = s.location_id "
    "WHERE s.active = 1 "
    "ORDER BY s.carrier_id, s.day_of_week, s.location_id, s.scheduled_time";

constexpr double kEarthRadiusKm = 6371.0088;
constexpr double kPi = 3.14159265358979323846;

struct GroupKey {
    std::string carrier_id;
    int weekday;
    bool operator<(const GroupKey& o) const {
        return carrier_id != o.carrier_id ? carrier_id < o.carrier_id
                                          : weekday < o.weekday;
    }
};

int DistinctTimes(const std::vector<ConsolidationStop>& stops) {
    std::set<std::string> times;
    for (const auto& s : stops) times.insert(s.scheduled_time);
    return static_cast<int>(times.size());
}

bool IsCandidate(const std::vector<ConsolidationStop>& stops) {
    return stops.size() >= 2 && DistinctTimes(stops) >= 2;
}

double WidestPair(const std::vector<ConsolidationStop>& stops) {
    double widest = 0.0;
    for (size_t i = 0; i < stops.size(); ++i) {
        for (size_t j = i + 1; j < stops.size(); ++j) {
            widest = std::max(widest, HaversineKm(*stops[i].latitude, *stops[i].longitude,
                                                  *stops[j].latitude, *stops[j].longitude));
        }
    }
    return widest;
}

size_t FindRoot(std::vector<size_t>& parent, size_t i) {
    while (parent[i] != i) {
        parent[i] = parent[parent[i]];
        i = parent[i];
    }
    return i;
}

// Single-linkage clusters over stops that carry coordinates. Cluster order
// follows the first (lowest id) member.
std::vector<std::vector<ConsolidationStop>> Cluster(
    const std::vector<ConsolidationStop>& stops, double max_km) {
    std::vector<ConsolidationStop> located;
    for (const auto& s : stops) {
        if (s.latitude && s.longitude) located.push_back(s);
    }

    std::vector<size_t> parent(located.size());
    std::iota(parent.begin(), parent.end(), 0);
    for (size_t i = 0; i < located.size(); ++i) {
        for (size_t j = i + 1; j < located.size(); ++j) {
            double km = HaversineKm(*located[i].latitude, *located[i].longitude,
                                    *located[j].latitude, *located[j].longitude);
            if (km <= max_km) {
                auto a = FindRoot(parent, i);
                auto b = FindRoot(parent, j);
                if (a != b) parent[std::max(a, b)] = std::min(a, b);
            }
        }
    }

    std::map<size_t, std::vector<ConsolidationStop>> clusters;
    for (size_t i = 0; i < located.size(); ++i) {
        clusters[FindRoot(parent, i)].push_back(located[i]);
    }
    std::vector<std::vector<ConsolidationStop>> out;
    for (auto& [root, members] : clusters) {
        out.push_back(std::move(members));
    }
    return out;
}

} // anonymous namespace

double HaversineKm(double lat1, double lon1, double lat2, double lon2) {
    const double to_rad = kPi / 180.0;
    const double dlat = (lat2 - lat1) * to_rad;
    const double dlon = (lon2 - lon1) * to_rad;
    const double a = std::sin(dlat / 2) * std::sin(dlat / 2) +
                     std::cos(lat1 * to_rad) * std::cos(lat2 * to_rad) *
                     std::sin(dlon / 2) * std::sin(dlon / 2);
    return 2.0 * kEarthRadiusKm * std::asin(std::min(1.0, std::sqrt(a)));
}

Result<std::vector<ConsolidationOpportunity>, Error>
FindConsolidationOpportunities(IQueryExecutor& executor, const RuleConfig& config) {
    using namespace rule_utils;
    using R = Result<std::vector<ConsolidationOpportunity>, Error>;
    constexpr const char* kRule = "FindConsolidationOpportunities";

    auto locations = TableName::Create("locations");
    if (locations.IsErr()) {
        return R::Err(Error::Make(ErrorKind::QueryError, kRule, locations.Error()));
    }
    auto has_lat = HasColumn(executor, locations.Value(), "latitude");
    if (has_lat.IsErr()) return Propagate<std::vector<ConsolidationOpportunity>>(has_lat.Error(), kRule);
    auto has_lon = HasColumn(executor, locations.Value(), "longitude");
    if (has_lon.IsErr()) return Propagate<std::vector<ConsolidationOpportunity>>(has_lon.Error(), kRule);
    const bool with_coordinates = has_lat.Value() && has_lon.Value();

    auto rows = executor.Execute(
        with_coordinates ? kSchedulesWithCoordinatesSql : kSchedulesSql,
        ExecutionMode::ReadOnly);
    if (rows.IsErr()) return Propagate<std::vector<ConsolidationOpportunity>>(rows.Error(), kRule);

    std::map<GroupKey, std::vector<ConsolidationStop>> groups;
    std::map<std::string, std::string> carrier_names;
    for (const auto& row : rows.Value().rows) {
        GroupKey key{TextAt(row, 0), static_cast<int>(IntAt(row, 2))};
        carrier_names[key.carrier_id] = TextAt(row, 1);
        auto& stops = groups[key];
        const auto location_id = TextAt(row, 3);
        // One stop per location in a group; the earliest time is kept.
        if (!stops.empty() && stops.back().location_id == location_id) continue;

        ConsolidationStop stop;
        stop.location_id = location_id;
        stop.location_name = TextAt(row, 4);
        stop.scheduled_time = TextAt(row, 5);
        if (with_coordinates) {
            stop.latitude = AsDouble(row[6]);
            stop.longitude = AsDouble(row[7]);
        }
        stops.push_back(std::move(stop));
    }

    std::vector<ConsolidationOpportunity> opportunities;
    auto emit = [&](const GroupKey& key, std::vector<ConsolidationStop> stops,
                    bool gated) {
        ConsolidationOpportunity op;
        op.carrier_id = key.carrier_id;
        op.carrier_name = carrier_names[key.carrier_id];
        op.weekday = key.weekday;
        op.distinct_times = DistinctTimes(stops);
        op.distance_gated = gated;
        if (gated) op.max_distance_km = WidestPair(stops);
        op.stops = std::move(stops);
        opportunities.push_back(std::move(op));
    };

    for (auto& [key, stops] : groups) {
        if (!IsCandidate(stops)) continue;
        if (!with_coordinates) {
            emit(key, std::move(stops), false);
            continue;
        }
        for (auto& cluster : Cluster(stops, config.consolidation_max_distance_km)) {
            if (IsCandidate(cluster)) emit(key, std::move(cluster), true);
        }
    }

    LogInfo("rules", std::string(kRule) + ": " + std::to_string(opportunities.size()) +
            " opportunities" + (with_coordinates ? " (distance-gated)" : ""));
    return R::Ok(std::move(opportunities));
}

} // namespace cashlog
