#include "trendsim/ledger/trade_book.hpp"
#include "trendsim/domain/errors.hpp"

#include <limits>
#include <utility>

namespace trendsim {

// -----------------------------------------------------------------------------
// openRow()
// -----------------------------------------------------------------------------
void TradeBook::openRow(LedgerRow row) {
  if (row.isClosed()) {
    throw InvariantViolation("ledger row \"" + row.trade_id +
                             "\" opened with an exit section");
  }
  const std::string id = row.trade_id;
  auto [it, inserted] = rows_.emplace(id, std::move(row));
  if (!inserted) {
    throw InvariantViolation("duplicate ledger row \"" + id + "\"");
  }
  order_.push_back(id);
}

// -----------------------------------------------------------------------------
// closeRow()
// -----------------------------------------------------------------------------
const LedgerRow& TradeBook::closeRow(const std::string& trade_id,
                                     LedgerExit exit) {
  auto it = rows_.find(trade_id);
  if (it == rows_.end()) {
    throw InvariantViolation("no ledger row for trade \"" + trade_id + "\"");
  }
  if (it->second.isClosed()) {
    throw InvariantViolation("ledger row \"" + trade_id +
                             "\" already closed");
  }
  it->second.exit = std::move(exit);
  ++num_closed_;
  return it->second;
}

const LedgerRow* TradeBook::find(const std::string& trade_id) const {
  auto it = rows_.find(trade_id);
  return it == rows_.end() ? nullptr : &it->second;
}

std::vector<const LedgerRow*> TradeBook::rows() const {
  std::vector<const LedgerRow*> result;
  result.reserve(order_.size());
  for (const auto& id : order_) {
    result.push_back(&rows_.at(id));
  }
  return result;
}

// -----------------------------------------------------------------------------
// summarize()
// -----------------------------------------------------------------------------
SimulationStats TradeBook::summarize() const {
  SimulationStats stats;
  for (const auto& id : order_) {
    const LedgerRow& row = rows_.at(id);
    if (!row.isClosed()) {
      continue;
    }
    ++stats.num_trades;
    stats.total_gross_profit += row.exit->gross_profit;
    stats.total_net_profit += row.exit->net_profit;
    stats.total_slippage_cost += row.exit->slippage_cost;
    stats.total_transaction_cost += row.exit->transaction_cost;
  }

  if (stats.num_trades == 0) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    stats.avg_gross_profit = nan;
    stats.avg_net_profit = nan;
    stats.avg_slippage_cost = nan;
    stats.avg_transaction_cost = nan;
    return stats;
  }

  const auto n = static_cast<double>(stats.num_trades);
  stats.avg_gross_profit = stats.total_gross_profit / n;
  stats.avg_net_profit = stats.total_net_profit / n;
  stats.avg_slippage_cost = stats.total_slippage_cost / n;
  stats.avg_transaction_cost = stats.total_transaction_cost / n;
  return stats;
}

}  // namespace trendsim
