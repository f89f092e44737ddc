#pragma once

#include "trendsim/domain/config.hpp"
#include "trendsim/domain/direction.hpp"
#include "trendsim/domain/price_series.hpp"
#include "trendsim/domain/unit.hpp"
#include "trendsim/indicators/ema.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace trendsim {

// -----------------------------------------------------------------------------
// PriceRange: rolling high/low over a window of prior ticks
// -----------------------------------------------------------------------------
struct PriceRange {
  double high{0.0};
  double low{0.0};
};

// -----------------------------------------------------------------------------
// TradeOutcome: money side of closing one Unit
// -----------------------------------------------------------------------------
//
// @details
//   gross       = sign * (exit - entry) * unit_size * lot_size
//   slippage    = 2 * slippage_per_contract * lot_size * unit_size
//   transaction = rate * (entry leg notional + exit leg notional), each leg
//                 priced with slippage against the trader:
//                   long:  bought at entry + slip, sold at exit - slip
//                   short: sold at entry - slip, bought at exit + slip
//   net         = gross - slippage - transaction
// -----------------------------------------------------------------------------
struct TradeOutcome {
  double gross_profit{0.0};
  double slippage_cost{0.0};
  double transaction_cost{0.0};
  double net_profit{0.0};
};

// -----------------------------------------------------------------------------
// Security: per-instrument indicator state and open-position book
// -----------------------------------------------------------------------------
//
// @brief  Owns one instrument's price history, its ATR and (optionally)
//         MACD/Signal, its current unit size, and its open long and short
//         Units, oldest first.
//
// @details
// The Security answers questions (did a breakout happen, which stops are
// hit, what does closing this Unit earn) and applies the mutations the
// Portfolio asks for (open, remove, re-centre stops). It never decides on
// its own when to trade and holds no reference to its Portfolio: every
// portfolio-level input (risk percent, account size, margin cap) arrives as
// an argument.
//
// Per-tick protocol driven by the Portfolio:
//   1. updateIndicators(price)    ATR / MACD step against the last history
//                                 price
//   2. updateUnitSize(...)        risk-budget sizing from the fresh ATR
//   3..5. stop / exit / entry queries and mutations
//   6. appendPrice(time, price)   the tick joins the history
//
// Because the price is appended last, every rolling window queried during
// a tick covers strictly prior ticks.
//
// Invariant:
//   numTotalPositions() <= config().max_units. openUnit() refuses to break
//   it.
//
// Thread model:
//   Not thread-safe. Owned and driven by a single Portfolio.
// -----------------------------------------------------------------------------
class Security {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  config  Fully-resolved settings (see resolveSecurityConfig()).
  // @param  warmup  Price history preceding the first simulated tick, strictly
  //                 increasing in time. Must be long enough for the ATR
  //                 window (and MACD, when config.macd is set).
  //
  // Throws std::invalid_argument on a short or unordered warm-up series.
  // -------------------------------------------------------------------------
  Security(domain::SecurityConfig config, domain::PriceSeries warmup);

  const std::string& name() const { return config_.name; }
  const domain::SecurityConfig& config() const { return config_; }
  const domain::PriceSeries& history() const { return history_; }
  double lastPrice() const { return history_.back().price; }
  Timestamp lastTime() const { return history_.back().time; }

  double atr() const { return atr_; }
  const std::optional<indicators::MacdState>& macd() const { return macd_; }
  int unitSize() const { return unit_size_; }
  double entryAtr(domain::Direction direction) const;

  // --- Per-tick state -------------------------------------------------------

  // ATR and MACD/Signal step from lastPrice() to `price`.
  void updateIndicators(double price);

  // unitSize = floor((risk_percent / 100 * notional_account_size)
  //                  / (ATR * lot_size)), never negative. 0 while ATR is 0.
  void updateUnitSize(double risk_percent, double notional_account_size);

  // The traded size at `price`: min(unitSize, floor(cap / (margin_factor *
  // price * lot_size))). No cap when max_margin_per_trade is unset.
  int tradableUnitSize(double price,
                       const std::optional<double>& max_margin_per_trade) const;

  // Copies the current ATR into longEntryATR / shortEntryATR.
  void snapshotEntryAtr(domain::Direction direction);

  void appendPrice(Timestamp time, double price);

  // --- Policy predicates ----------------------------------------------------

  // High/low of the last `length` prices in history, or nullopt when fewer
  // than `length` exist.
  std::optional<PriceRange> priorRange(std::size_t length) const;

  // Breakout entry trigger. With long_at_high a long fires above the prior
  // high and a short below the prior low; otherwise the mapping flips.
  bool breakoutEntry(domain::Direction direction, double price,
                     std::size_t length, bool long_at_high) const;

  // Strict crossing between the previous and current tick. For Long:
  // MACD from below to above Signal (or zero). Short is the mirror.
  bool macdSignalCrossed(domain::Direction direction) const;
  bool macdZeroCrossed(domain::Direction direction) const;

  // Entry modifiers. Long: MACD > Signal / Signal < 0. Short mirrored.
  bool macdSignalAgrees(domain::Direction direction) const;
  bool signalPolarityAgrees(domain::Direction direction) const;

  // Pyramiding trigger: price moved at least atr_factor * entryATR in the
  // favourable direction since the most recent unit.
  bool movedForExtraUnit(domain::Direction direction, double price,
                         double atr_factor) const;

  // --- Positions ------------------------------------------------------------

  const std::deque<domain::Unit>& positions(domain::Direction direction) const;
  std::size_t numLongPositions() const { return long_positions_.size(); }
  std::size_t numShortPositions() const { return short_positions_.size(); }
  std::size_t numTotalPositions() const;
  bool isEntered(domain::Direction direction) const;
  bool isLoaded() const;

  // Creates a Unit at `price` with the direction's entry ATR snapshot and
  // appends it. Throws InvariantViolation if the security is loaded.
  const domain::Unit& openUnit(domain::Direction direction, double price,
                               Timestamp time, std::size_t tick,
                               int unit_size);

  // Removes and returns the Unit at `index` of the direction's list.
  domain::Unit removeUnit(domain::Direction direction, std::size_t index);

  // Rank-weighted stop re-centring after a pyramided unit:
  //   stop_i = originalStop_i +/- factor * ATR_i * rank_i
  // rank_i is the number of units added after unit i.
  void recenterStops(domain::Direction direction, double adjust_atr_factor);

  // Indices (ascending) of the direction's Units whose stop is hit.
  std::vector<std::size_t> stoppedOutIndices(domain::Direction direction,
                                             double price) const;

  TradeOutcome evaluateClose(const domain::Unit& unit,
                             double exit_price) const;

  // Sum of marginReq over every open Unit.
  double openMargin() const;

  // "<longs>L <shorts>S", e.g. "2L 0S".
  std::string quickSummary() const;

 private:
  std::deque<domain::Unit>& mutablePositions(domain::Direction direction);

  domain::SecurityConfig config_;
  domain::PriceSeries history_;

  double atr_{0.0};
  std::optional<indicators::MacdState> macd_;

  int unit_size_{0};
  double long_entry_atr_{0.0};
  double short_entry_atr_{0.0};

  std::deque<domain::Unit> long_positions_;
  std::deque<domain::Unit> short_positions_;
};

}  // namespace trendsim
