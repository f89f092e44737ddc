#pragma once

#include "trendsim/domain/config.hpp"
#include "trendsim/domain/direction.hpp"
#include "trendsim/domain/policy.hpp"
#include "trendsim/domain/price_series.hpp"
#include "trendsim/ledger/trade_book.hpp"
#include "trendsim/security/security.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trendsim {

// Receives (tick + 1) / n after every tick of run().
using ProgressSink = std::function<void(double)>;

// Receives every ledger row right after its exit section was written.
using TradeClosedSink = std::function<void(const LedgerRow&)>;

// -----------------------------------------------------------------------------
// Portfolio
// -----------------------------------------------------------------------------
//
// @brief  Owns the Securities, the account counters and the TradeBook, and
//         drives the tick-by-tick simulation.
//
// @details
// Provides a small lifecycle API so that main() and tests can run a
// simulation without wiring internals:
//
//   Portfolio portfolio(config);
//   portfolio.addSecurity({"sec_0"}, warmup_0);
//   portfolio.addSecurity({"sec_1"}, warmup_1);
//   portfolio.run(ticks, progress);   // processTick() * n, then finish()
//
// Tick protocol (processTick), strict order:
//   1. every Security steps ATR and MACD/Signal to its new price
//   2. every Security refreshes its unit size
//   3. stops        (if enabled) long and short, reverse index per Security
//   4. exits        the configured ExitType
//   5. entries      long across all Securities, then short
//   6. every Security appends the tick to its history
// and the books are checked before the tick is considered done.
//
// finish() force-closes what is still open at the last prices ("Exit all")
// and freezes the statistics.
//
// Invariants (checked after every tick and after finish(), violation throws
// InvariantViolation):
//   numLongPositions()  == sum of Security::numLongPositions()
//   numShortPositions() == sum of Security::numShortPositions()
//   marginTotal()       == sum of Unit::marginReq() over open Units
//   open ledger rows    == open Units
//
// Account model:
//   equity = initial notional account size + cumulative net profit.
//   With compound_account_size the notional account size (the base of the
//   risk budget) also moves by every closed trade's net profit.
//
// Thread model:
//   Single-threaded. One Portfolio per run; nothing is shared between runs.
//
// Ownership:
//   Portfolio
//    ├── config_       (PortfolioConfig, validated copy)
//    ├── securities_   (vector<unique_ptr<Security>>, insertion order)
//    └── book_         (TradeBook, value member)
// -----------------------------------------------------------------------------
class Portfolio {
 public:
  // Throws std::invalid_argument when config.validate() fails.
  explicit Portfolio(domain::PortfolioConfig config);

  Portfolio(const Portfolio&) = delete;
  Portfolio& operator=(const Portfolio&) = delete;
  Portfolio(Portfolio&&) = delete;
  Portfolio& operator=(Portfolio&&) = delete;

  // -------------------------------------------------------------------------
  // addSecurity(overrides, warmup)
  // -------------------------------------------------------------------------
  //
  // @brief  Resolves the overrides against the portfolio defaults and
  //         creates a Security from its warm-up series.
  //
  // @details
  // Securities are iterated in the order they were added, which fixes the
  // ledger order. Names must be unique. Must be called before the first
  // processTick().
  //
  // Throws std::invalid_argument on a duplicate name or bad warm-up, and
  // std::logic_error once the simulation has started.
  // -------------------------------------------------------------------------
  Security& addSecurity(const domain::SecurityOverrides& overrides,
                        domain::PriceSeries warmup);

  void setTradeClosedSink(TradeClosedSink sink);

  // -------------------------------------------------------------------------
  // processTick(tick)
  // -------------------------------------------------------------------------
  // Runs one tick. tick.prices[i] is the price of the i-th added Security.
  //
  // Throws std::invalid_argument naming the tick index on a malformed tick
  // (wrong price count, non-finite or non-positive price, timestamp not
  // after the previous one). Validation runs before any state changes.
  // -------------------------------------------------------------------------
  void processTick(const domain::Tick& tick);

  // Closes every open Unit at the last prices and returns the statistics.
  // processTick() and addSecurity() are rejected afterwards.
  const SimulationStats& finish();

  // processTick() for every row, then finish(). The sink is best effort:
  // an exception thrown from it is logged and the run continues.
  const SimulationStats& run(const domain::TickTable& ticks,
                             const ProgressSink& progress = {});

  // --- Accessors -------------------------------------------------------------

  const domain::PortfolioConfig& config() const { return config_; }
  std::size_t numLongPositions() const { return num_long_positions_; }
  std::size_t numShortPositions() const { return num_short_positions_; }
  std::size_t numPositions(domain::Direction direction) const;
  double equity() const { return equity_; }
  double marginTotal() const { return margin_total_; }
  double notionalAccountSize() const { return notional_account_size_; }
  double cumulativeGrossProfit() const { return cumulative_gross_profit_; }
  double cumulativeNetProfit() const { return cumulative_net_profit_; }
  std::size_t ticksProcessed() const { return ticks_processed_; }
  bool isFinished() const { return stats_.has_value(); }

  std::size_t numSecurities() const { return securities_.size(); }
  const Security& security(std::size_t index) const;
  const TradeBook& tradeBook() const { return book_; }

  // Set by finish().
  const std::optional<SimulationStats>& stats() const { return stats_; }

  // Multi-line dump of every open Unit, grouped by Security.
  std::string describePositions() const;

 private:
  void validateTick(const domain::Tick& tick) const;

  void applyStops(double price, Security& security);
  void applyExits(double price, Security& security);
  void applyEntries(domain::Direction direction, const domain::Tick& tick);

  bool entryTriggered(const Security& security, domain::Direction direction,
                      double price) const;
  bool exitTriggered(const Security& security, domain::Direction direction,
                     double price, std::optional<double>& threshold) const;

  void openUnit(Security& security, domain::Direction direction, double price,
                int unit_size);
  void closeUnit(Security& security, domain::Direction direction,
                 std::size_t index, double price, domain::ExitKind kind,
                 std::optional<double> breakout_threshold);
  void closeAll(Security& security, domain::Direction direction, double price,
                domain::ExitKind kind,
                const std::optional<double>& breakout_threshold);

  void checkInvariants() const;

  domain::PortfolioConfig config_;
  std::vector<std::unique_ptr<Security>> securities_;
  TradeBook book_;
  TradeClosedSink trade_closed_sink_;

  std::size_t num_long_positions_{0};
  std::size_t num_short_positions_{0};
  double initial_notional_{0.0};
  double notional_account_size_{0.0};
  double equity_{0.0};
  double margin_total_{0.0};
  double cumulative_gross_profit_{0.0};
  double cumulative_net_profit_{0.0};

  double peak_margin_{0.0};
  Timestamp peak_margin_time_{};

  // Index and time of the tick being processed (or the last one processed).
  std::size_t tick_index_{0};
  Timestamp tick_time_{};
  std::size_t ticks_processed_{0};

  std::optional<SimulationStats> stats_;
};

}  // namespace trendsim
