#include "trendsim/ledger/ledger_json.hpp"

#include <cmath>
#include <utility>

namespace trendsim {

namespace {

// nlohmann would write NaN as null anyway; being explicit keeps the report
// stable across library versions.
nlohmann::json number(double value) {
  if (!std::isfinite(value)) {
    return nullptr;
  }
  return value;
}

}  // namespace

// -----------------------------------------------------------------------------
// toJson(LedgerRow)
// -----------------------------------------------------------------------------
nlohmann::json toJson(const LedgerRow& row) {
  nlohmann::json j;
  j["trade_id"] = row.trade_id;
  j["security"] = row.security;
  j["direction"] = domain::directionToString(row.direction);
  j["entry_tick"] = row.entry_tick;
  j["entry_time_ms"] = timestamp_to_ms(row.entry_time);
  j["entry_price"] = row.entry_price;
  j["unit_size"] = row.unit_size;
  j["lot_size"] = row.lot_size;
  j["entry_atr"] = row.entry_atr;
  j["initial_stop_price"] = row.initial_stop_price;
  j["margin_req"] = row.margin_req;
  j["equity"] = row.equity;
  j["notional_account_size"] = row.notional_account_size;
  j["open_margin"] = row.open_margin;
  j["security_summary"] = row.security_summary;

  if (!row.exit) {
    j["exit"] = nullptr;
    return j;
  }

  const LedgerExit& x = *row.exit;
  nlohmann::json e;
  e["exit_tick"] = x.exit_tick;
  e["exit_time_ms"] = timestamp_to_ms(x.exit_time);
  e["exit_price"] = x.exit_price;
  e["exit_type"] = domain::exitKindToString(x.kind);
  e["breakout_threshold"] =
      x.breakout_threshold ? number(*x.breakout_threshold)
                           : nlohmann::json(nullptr);
  e["gross_profit"] = x.gross_profit;
  e["slippage_cost"] = x.slippage_cost;
  e["transaction_cost"] = x.transaction_cost;
  e["net_profit"] = x.net_profit;
  e["exit_atr"] = x.exit_atr;
  j["exit"] = std::move(e);
  return j;
}

// -----------------------------------------------------------------------------
// toJson(SimulationStats)
// -----------------------------------------------------------------------------
nlohmann::json toJson(const SimulationStats& stats) {
  nlohmann::json j;
  j["num_trades"] = stats.num_trades;
  j["total_gross_profit"] = stats.total_gross_profit;
  j["total_net_profit"] = stats.total_net_profit;
  j["total_slippage_cost"] = stats.total_slippage_cost;
  j["total_transaction_cost"] = stats.total_transaction_cost;
  j["avg_gross_profit"] = number(stats.avg_gross_profit);
  j["avg_net_profit"] = number(stats.avg_net_profit);
  j["avg_slippage_cost"] = number(stats.avg_slippage_cost);
  j["avg_transaction_cost"] = number(stats.avg_transaction_cost);
  j["peak_margin"] = stats.peak_margin;
  j["peak_margin_time_ms"] = timestamp_to_ms(stats.peak_margin_time);
  return j;
}

nlohmann::json ledgerReport(const TradeBook& book,
                            const SimulationStats& stats) {
  nlohmann::json trades = nlohmann::json::array();
  for (const LedgerRow* row : book.rows()) {
    trades.push_back(toJson(*row));
  }
  nlohmann::json report;
  report["stats"] = toJson(stats);
  report["trades"] = std::move(trades);
  return report;
}

}  // namespace trendsim
