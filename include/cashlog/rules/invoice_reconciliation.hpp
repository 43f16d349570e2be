#pragma once

#include <cashlog/core/result.hpp>
#include <cashlog/core/types.hpp>
#include <cashlog/store/i_query_executor.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cashlog {

// ---------------------------------------------------------------------------
// InvoiceReconciliation — one carrier invoice against the stops the carrier
// actually serviced that month.
// ---------------------------------------------------------------------------
struct InvoiceReconciliation {
    std::string carrier_id;
    std::string carrier_name;
    std::string month;              // YYYY-MM
    int64_t invoiced_stops = 0;
    int64_t serviced_stops = 0;     // completed + late outcomes
    int64_t stop_discrepancy = 0;   // invoiced - serviced
    double cost_per_stop = 0.0;
    double invoiced_amount = 0.0;
    double expected_amount = 0.0;   // serviced * cost_per_stop
    bool discrepancy = false;       // invoiced stops exceed serviced stops
};

// ---------------------------------------------------------------------------
// ReconcileCarrierInvoices — every invoice (or those of one month), ordered
// by month then carrier id.
//
// Outcomes are attributed to the carrier of the active schedule for the same
// location and weekday.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::vector<InvoiceReconciliation>, Error> ReconcileCarrierInvoices(
    IQueryExecutor& executor,
    const std::optional<YearMonth>& month);

} // namespace cashlog
