#pragma once

#include "trendsim/ledger/ledger_row.hpp"
#include "trendsim/ledger/trade_book.hpp"

#include <nlohmann/json.hpp>

namespace trendsim {

// -----------------------------------------------------------------------------
// JSON encoding of the ledger
// -----------------------------------------------------------------------------
// Shared by the run report (--ledger) and the telemetry publisher. Times are
// epoch milliseconds. Fields without a value (an open row's exit section, a
// non-breakout threshold, an average over zero trades) encode as null.
// -----------------------------------------------------------------------------
nlohmann::json toJson(const LedgerRow& row);
nlohmann::json toJson(const SimulationStats& stats);

// {"stats": {...}, "trades": [row, ...]} with rows in entry order.
nlohmann::json ledgerReport(const TradeBook& book, const SimulationStats& stats);

}  // namespace trendsim
