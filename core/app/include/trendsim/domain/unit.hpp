#pragma once

#include "trendsim/domain/direction.hpp"
#include "trendsim/time/time_utils.hpp"

#include <cstddef>
#include <string>

namespace trendsim {
namespace domain {

// -----------------------------------------------------------------------------
// UnitTerms
// -----------------------------------------------------------------------------
// Economic terms of a lot, fixed when it is entered.
// -----------------------------------------------------------------------------
struct UnitTerms {
  Direction direction{Direction::Long};
  std::string security;
  double entry_price{0.0};
  Timestamp entry_time{};
  std::size_t entry_tick{0};     // simulation tick index of the entry
  double atr{0.0};               // ATR snapshot taken at entry
  int unit_size{0};              // contracts
  int lot_size{1};               // units of the instrument per contract
  double margin_factor{1.0};     // fraction of notional held as margin
  double stop_loss_factor{2.0};  // stop distance in ATRs
};

// -----------------------------------------------------------------------------
// Unit: one traded lot
// -----------------------------------------------------------------------------
//
// @brief  A discrete position created at entry and closed as a whole.
//
// @details
// Everything except the stop price is immutable after construction:
//
//   originalStopPrice = entry_price - stop_loss_factor * atr   (long)
//                     = entry_price + stop_loss_factor * atr   (short)
//   value(p)          = p * unit_size * lot_size
//   marginReq         = value(entry_price) * margin_factor
//
// The stop starts at originalStopPrice. Only the pyramiding rule moves it,
// and it always moves relative to originalStopPrice.
//
// The trade id is derived from (security, entry time) and keys the Unit's
// ledger row.
//
// Ownership:
//   Held by value in its Security's long or short list until closed.
// -----------------------------------------------------------------------------
class Unit {
 public:
  explicit Unit(UnitTerms terms);

  Direction direction() const { return terms_.direction; }
  bool isLong() const { return terms_.direction == Direction::Long; }
  const std::string& security() const { return terms_.security; }
  double entryPrice() const { return terms_.entry_price; }
  Timestamp entryTime() const { return terms_.entry_time; }
  std::size_t entryTick() const { return terms_.entry_tick; }
  double atr() const { return terms_.atr; }
  int unitSize() const { return terms_.unit_size; }
  int lotSize() const { return terms_.lot_size; }
  double marginFactor() const { return terms_.margin_factor; }
  double stopLossFactor() const { return terms_.stop_loss_factor; }
  const std::string& tradeId() const { return trade_id_; }

  double originalStopPrice() const { return original_stop_price_; }
  double stopPrice() const { return stop_price_; }
  void setStopPrice(double stop_price) { stop_price_ = stop_price; }

  // Notional of the lot at `price`.
  double value(double price) const;
  double marginReq() const;

  // Long: stop above the price. Short: stop below the price.
  bool isStoppedOut(double price) const;

  // One-line human readable description for logs.
  std::string describe() const;

 private:
  UnitTerms terms_;
  std::string trade_id_;
  double original_stop_price_{0.0};
  double stop_price_{0.0};
};

// "<security>@<entry epoch ms>/<L|S>". A security can open a long and a
// short unit on the same tick (countertrend entries, pyramids), so the
// direction is part of the key.
std::string makeTradeId(const std::string& security, Timestamp entry_time,
                        Direction direction);

}  // namespace domain
}  // namespace trendsim
