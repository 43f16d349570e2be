#include <cashlog/rules/invoice_reconciliation.hpp>

#include "rule_utils.hpp"

#include <map>
#include <utility>

namespace cashlog {

namespace {

const char* kInvoicesSql =
    "SELECT i.carrier_id, COALESCE(c.name, ''), i.month, i.total_stops, "
    "       i.cost_per_stop, i.total_amount "
    "FROM carrier_invoices i "
    "LEFT JOIN carriers c ON c.carrier_id = i.carrier_id "
    "WHERE (?1 IS NULL OR i.month = ?1) "
    "ORDER BY i.month, i.carrier_id";

const char* kServicedStopsSql =
    "SELECT s.carrier_id, substr(p.scheduled_date, 1, 7) AS month, COUNT(*) "
    "FROM scheduled_pickups p "
    "JOIN pickup_schedules s ON s.location_id = p.location_id AND s.active = 1 "
    " AND s.day_of_week = "
    "     (CAST(strftime('%w', substr(p.scheduled_date, 1, 10)) AS INTEGER) + 6) % 7 "
    "WHERE p.status IN ('completed', 'late') "
    "  AND (?1 IS NULL OR substr(p.scheduled_date, 1, 7) = ?1) "
    "GROUP BY s.carrier_id, month";

} // anonymous namespace

Result<std::vector<InvoiceReconciliation>, Error> ReconcileCarrierInvoices(
    IQueryExecutor& executor,
    const std::optional<YearMonth>& month) {
    using namespace rule_utils;
    using R = Result<std::vector<InvoiceReconciliation>, Error>;
    constexpr const char* kRule = "ReconcileCarrierInvoices";

    const Value filter = month ? Value{month->ToString()} : Value{};

    auto serviced_rows = executor.Execute(kServicedStopsSql, ExecutionMode::ReadOnly, {filter});
    if (serviced_rows.IsErr()) {
        return Propagate<std::vector<InvoiceReconciliation>>(serviced_rows.Error(), kRule);
    }
    std::map<std::pair<std::string, std::string>, int64_t> serviced;
    for (const auto& row : serviced_rows.Value().rows) {
        serviced[{TextAt(row, 0), TextAt(row, 1)}] = IntAt(row, 2);
    }

    auto invoice_rows = executor.Execute(kInvoicesSql, ExecutionMode::ReadOnly, {filter});
    if (invoice_rows.IsErr()) {
        return Propagate<std::vector<InvoiceReconciliation>>(invoice_rows.Error(), kRule);
    }

    std::vector<InvoiceReconciliation> out;
    int flagged = 0;
    for (const auto& row : invoice_rows.Value().rows) {
        InvoiceReconciliation r;
        r.carrier_id = TextAt(row, 0);
        r.carrier_name = TextAt(row, 1);
        r.month = TextAt(row, 2);
        r.invoiced_stops = IntAt(row, 3);
        r.cost_per_stop = NumberAt(row, 4);
        r.invoiced_amount = NumberAt(row, 5);
        auto it = serviced.find({r.carrier_id, r.month});
        r.serviced_stops = it == serviced.end() ? 0 : it->second;
        r.stop_discrepancy = r.invoiced_stops - r.serviced_stops;
        r.expected_amount = static_cast<double>(r.serviced_stops) * r.cost_per_stop;
        r.discrepancy = r.invoiced_stops > r.serviced_stops;
        if (r.discrepancy) ++flagged;
        out.push_back(std::move(r));
    }

    LogInfo("rules", std::string(kRule) + ": " + std::to_string(flagged) + " of " +
            std::to_string(out.size()) + " invoices over-billed");
    return R::Ok(std::move(out));
}

} // namespace cashlog
