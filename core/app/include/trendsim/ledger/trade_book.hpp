#pragma once

#include "trendsim/ledger/ledger_row.hpp"
#include "trendsim/time/time_utils.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace trendsim {

// -----------------------------------------------------------------------------
// SimulationStats
// -----------------------------------------------------------------------------
// Aggregates over closed rows. Averages are per closed trade and NaN when
// no trade closed. Peak margin is the largest open-margin total seen after
// any entry, with the tick time at which it was reached.
// -----------------------------------------------------------------------------
struct SimulationStats {
  std::size_t num_trades{0};
  double total_gross_profit{0.0};
  double total_net_profit{0.0};
  double total_slippage_cost{0.0};
  double total_transaction_cost{0.0};
  double avg_gross_profit{0.0};
  double avg_net_profit{0.0};
  double avg_slippage_cost{0.0};
  double avg_transaction_cost{0.0};
  double peak_margin{0.0};
  Timestamp peak_margin_time{};
};

// -----------------------------------------------------------------------------
// TradeBook: the trade ledger
// -----------------------------------------------------------------------------
//
// @brief  Map trade id → LedgerRow plus the ids in insertion (entry) order.
//
// @details
// Rows are created once by openRow() and closed once by closeRow(); they
// are never removed. A second openRow() for the same id, or a closeRow() of
// a missing or already-closed row, means the Portfolio's books are broken
// and throws InvariantViolation.
//
// Thread model:
//   Not thread-safe. Owned by the Portfolio.
// -----------------------------------------------------------------------------
class TradeBook {
 public:
  TradeBook() = default;

  void openRow(LedgerRow row);

  // Writes the exit section and returns the completed row.
  const LedgerRow& closeRow(const std::string& trade_id, LedgerExit exit);

  // nullptr when no row has this id.
  const LedgerRow* find(const std::string& trade_id) const;

  // Rows in entry order.
  std::vector<const LedgerRow*> rows() const;

  std::size_t size() const { return order_.size(); }
  std::size_t numOpen() const { return order_.size() - num_closed_; }
  std::size_t numClosed() const { return num_closed_; }

  // Totals and averages over closed rows. Peak margin is left to the caller.
  SimulationStats summarize() const;

 private:
  std::unordered_map<std::string, LedgerRow> rows_;
  std::vector<std::string> order_;
  std::size_t num_closed_{0};
};

}  // namespace trendsim
