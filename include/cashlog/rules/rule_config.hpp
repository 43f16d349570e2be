#pragma once

namespace cashlog {

// ---------------------------------------------------------------------------
// RuleConfig — every threshold the rule engine consults.
//
// Passed explicitly into each rule invocation; tools may override single
// fields per call.
// ---------------------------------------------------------------------------
struct RuleConfig {
    // Risk scoring.
    double high_volume_threshold = 30000.0;   // dollars per day
    double cash_sitting_hours = 48.0;

    // Window for the trailing average daily deposit.
    int trailing_volume_days = 30;

    // Schedule mismatch.
    int deposit_history_days = 90;
    int peak_day_tolerance_days = 1;
    double low_volume_threshold = 10000.0;
    int over_service_min_pickups = 3;         // pickups per week
    int under_service_max_pickups = 2;

    // Consolidation; only applied when locations carry coordinates.
    double consolidation_max_distance_km = 25.0;

    // Longest date range a single rule call may span.
    int max_range_days = 366;
};

} // namespace cashlog
