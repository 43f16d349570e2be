#include <catch2/catch_test_macros.hpp>

#include "fixtures/logistics_fixture.hpp"

#include <cashlog/rules/risk_scoring.hpp>

#include <map>

using namespace cashlog;
using namespace cashlog::testing;

// ===========================================================================
// ClassifyRisk
// ===========================================================================

TEST_CASE("ClassifyRisk: crossing the sitting threshold flips to high risk", "[rules][risk]") {
    const RuleConfig config;
    for (int64_t days = 0; days <= 2; ++days) {
        INFO(days);
        CHECK_FALSE(ClassifyRisk(5000.0, days, config).high_risk);
    }
    for (int64_t days = 3; days <= 10; ++days) {
        INFO(days);
        auto score = ClassifyRisk(5000.0, days, config);
        CHECK(score.high_risk);
        CHECK(score.cash_sitting_too_long);
        CHECK_FALSE(score.high_volume_overdue);
    }
}

TEST_CASE("ClassifyRisk: high volume overdue after one day", "[rules][risk]") {
    const RuleConfig config;
    CHECK_FALSE(ClassifyRisk(30000.0, 1, config).high_risk);

    auto overdue = ClassifyRisk(30000.0, 2, config);
    CHECK(overdue.high_volume_overdue);
    CHECK_FALSE(overdue.cash_sitting_too_long);
    CHECK(overdue.high_risk);
    CHECK(overdue.cash_at_risk == 60000.0);

    CHECK_FALSE(ClassifyRisk(29999.0, 2, config).high_risk);
}

TEST_CASE("ClassifyRisk: thresholds come from the config", "[rules][risk]") {
    RuleConfig config;
    config.cash_sitting_hours = 12.0;
    config.high_volume_threshold = 1000.0;
    CHECK(ClassifyRisk(10.0, 1, config).cash_sitting_too_long);
    CHECK(ClassifyRisk(1000.0, 2, config).high_volume_overdue);
}

TEST_CASE("ClassifyRisk: never picked up", "[rules][risk]") {
    const RuleConfig config;
    auto score = ClassifyRisk(40000.0, std::nullopt, config);
    CHECK(score.high_risk);
    CHECK(score.cash_sitting_too_long);
    CHECK(score.high_volume_overdue);
    CHECK_FALSE(score.days_since_pickup.has_value());
    CHECK(score.cash_at_risk == 40000.0 * 30);

    CHECK_FALSE(ClassifyRisk(100.0, std::nullopt, config).high_volume_overdue);
}

// ===========================================================================
// ScoreRisk
// ===========================================================================

TEST_CASE("ScoreRisk: scores every location as of a date", "[rules][risk]") {
    auto executor = OpenMemoryStore();
    AddLocation(*executor, "LOC-A", "Recent", 5000.0);
    AddLocation(*executor, "LOC-B", "Stale", 5000.0);
    AddLocation(*executor, "LOC-C", "Busy", 40000.0);
    AddLocation(*executor, "LOC-D", "Never", 2000.0);

    AddOutcome(*executor, "LOC-A", "2024-03-09", "completed");
    AddOutcome(*executor, "LOC-B", "2024-03-06", "completed");
    AddOutcome(*executor, "LOC-B", "2024-03-09", "missed");
    AddOutcome(*executor, "LOC-C", "2024-03-08 16:00", "completed");
    // After the as-of date.
    AddOutcome(*executor, "LOC-D", "2024-03-11", "completed");

    auto scores = ScoreRisk(*executor, CivilDate::FromYmd(2024, 3, 10), RuleConfig{});
    REQUIRE(scores.IsOk());
    REQUIRE(scores.Value().size() == 4);

    std::map<std::string, RiskScore> by_id;
    for (const auto& s : scores.Value()) by_id[s.location_id] = s;
    CHECK(scores.Value()[0].location_id == "LOC-A");

    const auto& a = by_id["LOC-A"];
    CHECK(*a.days_since_pickup == 1);
    CHECK(*a.last_pickup == CivilDate::FromYmd(2024, 3, 9));
    CHECK_FALSE(a.high_risk);
    CHECK(a.cash_at_risk == 5000.0);

    const auto& b = by_id["LOC-B"];
    CHECK(*b.days_since_pickup == 4);
    CHECK(b.cash_sitting_too_long);
    CHECK(b.high_risk);
    CHECK(b.cash_at_risk == 20000.0);

    const auto& c = by_id["LOC-C"];
    CHECK(*c.days_since_pickup == 2);
    CHECK(c.high_volume_overdue);
    CHECK_FALSE(c.cash_sitting_too_long);
    CHECK(c.high_risk);

    const auto& d = by_id["LOC-D"];
    CHECK_FALSE(d.last_pickup.has_value());
    CHECK(d.high_risk);
    CHECK(d.location_name == "Never");
}

TEST_CASE("ScoreRisk: deposits drive the daily volume", "[rules][risk]") {
    auto executor = OpenMemoryStore();
    AddLocation(*executor, "LOC-1", "Main Street", 100.0);
    AddDeposit(*executor, "LOC-1", "2024-03-01", 900000.0);
    AddOutcome(*executor, "LOC-1", "2024-03-08", "completed");

    auto scores = ScoreRisk(*executor, CivilDate::FromYmd(2024, 3, 10), RuleConfig{});
    REQUIRE(scores.IsOk());
    const auto& s = scores.Value().at(0);
    CHECK(s.daily_volume == 30000.0);
    CHECK(s.high_volume_overdue);
    CHECK(s.cash_at_risk == 60000.0);
}
