#include <cashlog/mcp/tool_dispatcher.hpp>

#include <cashlog/core/log.hpp>
#include <cashlog/rules/consolidation.hpp>
#include <cashlog/rules/findings.hpp>
#include <cashlog/rules/invoice_reconciliation.hpp>
#include <cashlog/rules/missed_pickups.hpp>
#include <cashlog/rules/risk_scoring.hpp>
#include <cashlog/rules/schedule_mismatch.hpp>
#include <cashlog/store/schema_catalog.hpp>

#include <string>

namespace cashlog {

namespace {

using Json = nlohmann::json;
using JsonResult = Result<Json, Error>;

template <typename T>
Json OptionalToJson(const std::optional<T>& value) {
    if (!value) return nullptr;
    return *value;
}

Json OptionalDateToJson(const std::optional<CivilDate>& date) {
    if (!date) return nullptr;
    return date->ToString();
}

Json WeekdayToJson(const std::optional<int>& weekday) {
    if (!weekday) return nullptr;
    return {{"day", *weekday}, {"name", WeekdayName(*weekday)}};
}

// ---------------------------------------------------------------------------
// Rule result serialization
// ---------------------------------------------------------------------------

Json ToJson(const MissedPickup& m) {
    return {{"location_id", m.location_id},
            {"location_name", m.location_name},
            {"carrier_id", m.carrier_id},
            {"scheduled_date", m.scheduled_date.ToString()},
            {"scheduled_time", m.scheduled_time},
            {"recorded_status", OptionalToJson(m.recorded_status)},
            {"days_elapsed", m.days_elapsed},
            {"trailing_daily_volume", m.trailing_daily_volume},
            {"cash_at_risk", m.cash_at_risk}};
}

Json ToJson(const RiskScore& s) {
    return {{"location_id", s.location_id},
            {"location_name", s.location_name},
            {"daily_volume", s.daily_volume},
            {"last_pickup_date", OptionalDateToJson(s.last_pickup)},
            {"days_since_pickup", OptionalToJson(s.days_since_pickup)},
            {"high_volume_overdue", s.high_volume_overdue},
            {"cash_sitting_too_long", s.cash_sitting_too_long},
            {"high_risk", s.high_risk},
            {"cash_at_risk", s.cash_at_risk}};
}

Json ToJson(const ScheduleMismatch& m) {
    Json by_weekday = Json::object();
    for (int day = 0; day < 7; ++day) {
        by_weekday[WeekdayName(day)] = m.deposits_by_weekday[static_cast<size_t>(day)];
    }
    return {{"location_id", m.location_id},
            {"location_name", m.location_name},
            {"daily_volume", m.daily_volume},
            {"deposits_by_weekday", by_weekday},
            {"pickup_weekdays", m.pickup_weekdays},
            {"weekly_pickups", m.pickup_weekdays.size()},
            {"peak_deposit_day", WeekdayToJson(m.peak_deposit_day)},
            {"peak_pickup_day", WeekdayToJson(m.peak_pickup_day)},
            {"peak_day_distance", OptionalToJson(m.peak_day_distance)},
            {"peak_day_mismatch", m.peak_day_mismatch},
            {"over_serviced", m.over_serviced},
            {"under_serviced", m.under_serviced}};
}

Json ToJson(const ConsolidationOpportunity& op) {
    Json stops = Json::array();
    for (const auto& s : op.stops) {
        stops.push_back({{"location_id", s.location_id},
                         {"location_name", s.location_name},
                         {"scheduled_time", s.scheduled_time},
                         {"latitude", OptionalToJson(s.latitude)},
                         {"longitude", OptionalToJson(s.longitude)}});
    }
    return {{"carrier_id", op.carrier_id},
            {"carrier_name", op.carrier_name},
            {"weekday", WeekdayToJson(op.weekday)},
            {"stops", stops},
            {"distinct_times", op.distinct_times},
            {"distance_gated", op.distance_gated},
            {"max_distance_km", OptionalToJson(op.max_distance_km)}};
}

Json ToJson(const InvoiceReconciliation& r) {
    return {{"carrier_id", r.carrier_id},
            {"carrier_name", r.carrier_name},
            {"month", r.month},
            {"invoiced_stops", r.invoiced_stops},
            {"serviced_stops", r.serviced_stops},
            {"stop_discrepancy", r.stop_discrepancy},
            {"cost_per_stop", r.cost_per_stop},
            {"invoiced_amount", r.invoiced_amount},
            {"expected_amount", r.expected_amount},
            {"amount_discrepancy", r.invoiced_amount - r.expected_amount},
            {"discrepancy", r.discrepancy}};
}

Json ToJson(const Finding& f) {
    return {{"location_id", f.location_id},
            {"kind", FindingKindName(f.kind)},
            {"severity", SeverityName(f.severity)},
            {"cash_at_risk", f.cash_at_risk},
            {"summary", f.summary}};
}

template <typename T>
Json ArrayToJson(const std::vector<T>& items) {
    Json out = Json::array();
    for (const auto& item : items) out.push_back(ToJson(item));
    return out;
}

// ---------------------------------------------------------------------------
// Visitor — one overload per ToolCall alternative.
// ---------------------------------------------------------------------------
struct CallVisitor {
    IQueryExecutor& executor;

    JsonResult operator()(const ListTablesCall&) const {
        return ListTables(executor).Map([](const std::vector<std::string>& tables) {
            return Json{{"tables", tables}};
        });
    }

    JsonResult operator()(const DescribeTableCall& call) const {
        return DescribeTable(executor, call.table).Map(
            [&](const std::vector<ColumnInfo>& columns) {
                Json cols = Json::array();
                for (const auto& c : columns) {
                    cols.push_back({{"name", c.name},
                                    {"type", c.declared_type},
                                    {"nullable", c.nullable},
                                    {"primary_key", c.primary_key_position},
                                    {"default", OptionalToJson(c.default_value)}});
                }
                return Json{{"table", call.table.Value()}, {"columns", cols}};
            });
    }

    JsonResult operator()(const ReadQueryCall& call) const {
        return executor.Execute(call.query, ExecutionMode::ReadOnly)
            .Map(QueryResultToJson);
    }

    JsonResult operator()(const WriteQueryCall& call) const {
        return executor.Execute(call.query, ExecutionMode::ReadWrite)
            .Map(QueryResultToJson);
    }

    JsonResult operator()(const DetectMissedPickupsCall& call) const {
        return DetectMissedPickups(executor, call.range, call.config).Map(
            [&](const std::vector<MissedPickup>& missed) {
                double total = 0.0;
                for (const auto& m : missed) total += m.cash_at_risk;
                return Json{{"start_date", call.range.start.ToString()},
                            {"end_date", call.range.end.ToString()},
                            {"count", missed.size()},
                            {"total_cash_at_risk", total},
                            {"missed_pickups", ArrayToJson(missed)}};
            });
    }

    JsonResult operator()(const ScoreRiskCall& call) const {
        return ScoreRisk(executor, call.as_of, call.config).Map(
            [&](const std::vector<RiskScore>& scores) {
                Json locations = Json::array();
                int high_risk = 0;
                for (const auto& s : scores) {
                    if (s.high_risk) ++high_risk;
                    if (call.only_high_risk && !s.high_risk) continue;
                    locations.push_back(ToJson(s));
                }
                return Json{{"as_of_date", call.as_of.ToString()},
                            {"high_volume_threshold", call.config.high_volume_threshold},
                            {"cash_sitting_hours", call.config.cash_sitting_hours},
                            {"high_risk_count", high_risk},
                            {"locations", locations}};
            });
    }

    JsonResult operator()(const DetectScheduleMismatchesCall& call) const {
        return DetectScheduleMismatches(executor, call.as_of, call.config).Map(
            [&](const std::vector<ScheduleMismatch>& mismatches) {
                return Json{{"as_of_date", call.as_of.ToString()},
                            {"mismatches", ArrayToJson(mismatches)}};
            });
    }

    JsonResult operator()(const FindConsolidationCall& call) const {
        return FindConsolidationOpportunities(executor, call.config).Map(
            [](const std::vector<ConsolidationOpportunity>& ops) {
                return Json{{"opportunities", ArrayToJson(ops)}};
            });
    }

    JsonResult operator()(const ReconcileInvoicesCall& call) const {
        return ReconcileCarrierInvoices(executor, call.month).Map(
            [&](const std::vector<InvoiceReconciliation>& invoices) {
                return Json{{"month", call.month ? Json(call.month->ToString()) : Json()},
                            {"invoices", ArrayToJson(invoices)}};
            });
    }

    JsonResult operator()(const CollectFindingsCall& call) const {
        return CollectFindings(executor, call.range, call.config).Map(
            [&](const std::vector<Finding>& findings) {
                return Json{{"start_date", call.range.start.ToString()},
                            {"end_date", call.range.end.ToString()},
                            {"findings", ArrayToJson(findings)}};
            });
    }
};

const char kHexDigits[] = "0123456789abcdef";

} // anonymous namespace

Json CellToJson(const Value& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return *i;
    if (const auto* d = std::get_if<double>(&value)) return *d;
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    if (const auto* b = std::get_if<Blob>(&value)) {
        std::string hex;
        hex.reserve(b->bytes.size() * 2);
        for (uint8_t byte : b->bytes) {
            hex.push_back(kHexDigits[byte >> 4]);
            hex.push_back(kHexDigits[byte & 0x0f]);
        }
        return hex;
    }
    return nullptr;
}

Json QueryResultToJson(const QueryResult& result) {
    Json rows = Json::array();
    for (const auto& row : result.rows) {
        Json cells = Json::array();
        for (const auto& cell : row) cells.push_back(CellToJson(cell));
        rows.push_back(std::move(cells));
    }
    Json out = {{"columns", result.columns},
                {"rows", rows},
                {"row_count", result.rows.size()}};
    if (result.affected_rows) {
        out["affected_rows"] = *result.affected_rows;
    }
    return out;
}

Result<Json, Error> ToolDispatcher::Dispatch(const ToolCall& call) {
    LogDebug("mcp", std::string("Dispatching ") + ToolName(call));
    auto result = std::visit(CallVisitor{executor_}, call);
    if (result.IsErr()) {
        LogWarn("mcp", std::string(ToolName(call)) + ": " + result.Error().ToString());
    }
    return result;
}

} // namespace cashlog
