#include "trendsim/security/security.hpp"
#include "trendsim/domain/errors.hpp"
#include "trendsim/indicators/atr.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace trendsim {

using domain::Direction;
using domain::Unit;

namespace {

// Floors a non-negative size into an int contract count. NaN, negatives and
// anything below one contract become 0.
int toContracts(double raw) {
  const double floored = std::floor(raw);
  if (!(floored > 0.0)) {
    return 0;
  }
  if (floored >= static_cast<double>(std::numeric_limits<int>::max())) {
    return std::numeric_limits<int>::max();
  }
  return static_cast<int>(floored);
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: validate warm-up, compute initial indicators
// -----------------------------------------------------------------------------
Security::Security(domain::SecurityConfig config, domain::PriceSeries warmup)
    : config_(std::move(config)), history_(std::move(warmup)) {
  for (std::size_t i = 1; i < history_.size(); ++i) {
    if (history_[i].time <= history_[i - 1].time) {
      throw std::invalid_argument("security \"" + config_.name +
                                  "\": warm-up timestamps must be strictly "
                                  "increasing (index " +
                                  std::to_string(i) + ")");
    }
  }

  const std::vector<double> prices = domain::pricesOf(history_);
  atr_ = indicators::initATR(prices, config_.atr_average_range);
  if (config_.macd) {
    macd_ = indicators::initMACD(prices, *config_.macd);
  }
}

double Security::entryAtr(Direction direction) const {
  return direction == Direction::Long ? long_entry_atr_ : short_entry_atr_;
}

// -----------------------------------------------------------------------------
// updateIndicators: O(1) step from the last known price
// -----------------------------------------------------------------------------
void Security::updateIndicators(double price) {
  atr_ = indicators::stepATR(atr_, lastPrice(), price,
                             config_.atr_average_range);
  if (macd_) {
    macd_ = indicators::stepMACD(*macd_, price, *config_.macd);
  }
}

// -----------------------------------------------------------------------------
// updateUnitSize: volatility-based risk budget
// -----------------------------------------------------------------------------
void Security::updateUnitSize(double risk_percent,
                              double notional_account_size) {
  if (!(atr_ > 0.0)) {
    unit_size_ = 0;
    return;
  }
  const double budget = risk_percent / 100.0 * notional_account_size;
  unit_size_ = toContracts(budget / (atr_ * config_.lot_size));
}

// -----------------------------------------------------------------------------
// tradableUnitSize: apply the per-trade margin ceiling
// -----------------------------------------------------------------------------
int Security::tradableUnitSize(
    double price, const std::optional<double>& max_margin_per_trade) const {
  if (!max_margin_per_trade) {
    return unit_size_;
  }
  const double margin_per_contract =
      config_.margin_factor * price * config_.lot_size;
  const int max_unit_size =
      toContracts(*max_margin_per_trade / margin_per_contract);
  return std::min(unit_size_, max_unit_size);
}

void Security::snapshotEntryAtr(Direction direction) {
  if (direction == Direction::Long) {
    long_entry_atr_ = atr_;
  } else {
    short_entry_atr_ = atr_;
  }
}

void Security::appendPrice(Timestamp time, double price) {
  history_.push_back(domain::PricePoint{time, price});
}

// -----------------------------------------------------------------------------
// priorRange: rolling high/low over strictly prior ticks
// -----------------------------------------------------------------------------
std::optional<PriceRange> Security::priorRange(std::size_t length) const {
  if (length == 0 || history_.size() < length) {
    return std::nullopt;
  }
  auto first = history_.end() - static_cast<std::ptrdiff_t>(length);
  auto [lo, hi] = std::minmax_element(
      first, history_.end(),
      [](const domain::PricePoint& a, const domain::PricePoint& b) {
        return a.price < b.price;
      });
  return PriceRange{hi->price, lo->price};
}

bool Security::breakoutEntry(Direction direction, double price,
                             std::size_t length, bool long_at_high) const {
  const auto range = priorRange(length);
  if (!range) {
    return false;
  }
  const bool at_high = (direction == Direction::Long) == long_at_high;
  return at_high ? price > range->high : price < range->low;
}

// -----------------------------------------------------------------------------
// MACD predicates. NaN "previous" values make every comparison false.
// -----------------------------------------------------------------------------
bool Security::macdSignalCrossed(Direction direction) const {
  if (!macd_) {
    return false;
  }
  const auto& m = *macd_;
  if (direction == Direction::Long) {
    return m.prev_macd < m.prev_signal && m.macd > m.signal;
  }
  return m.prev_macd > m.prev_signal && m.macd < m.signal;
}

bool Security::macdZeroCrossed(Direction direction) const {
  if (!macd_) {
    return false;
  }
  const auto& m = *macd_;
  if (direction == Direction::Long) {
    return m.prev_macd < 0.0 && m.macd > 0.0;
  }
  return m.prev_macd > 0.0 && m.macd < 0.0;
}

bool Security::macdSignalAgrees(Direction direction) const {
  if (!macd_) {
    return false;
  }
  return direction == Direction::Long ? macd_->macd > macd_->signal
                                      : macd_->macd < macd_->signal;
}

bool Security::signalPolarityAgrees(Direction direction) const {
  if (!macd_) {
    return false;
  }
  return direction == Direction::Long ? macd_->signal < 0.0
                                      : macd_->signal > 0.0;
}

bool Security::movedForExtraUnit(Direction direction, double price,
                                 double atr_factor) const {
  const auto& units = positions(direction);
  if (units.empty()) {
    return false;
  }
  const double moved =
      domain::directionSign(direction) * (price - units.back().entryPrice());
  return moved >= atr_factor * entryAtr(direction);
}

// -----------------------------------------------------------------------------
// Positions
// -----------------------------------------------------------------------------
const std::deque<Unit>& Security::positions(Direction direction) const {
  return direction == Direction::Long ? long_positions_ : short_positions_;
}

std::deque<Unit>& Security::mutablePositions(Direction direction) {
  return direction == Direction::Long ? long_positions_ : short_positions_;
}

std::size_t Security::numTotalPositions() const {
  return long_positions_.size() + short_positions_.size();
}

bool Security::isEntered(Direction direction) const {
  return !positions(direction).empty();
}

bool Security::isLoaded() const {
  return numTotalPositions() >= static_cast<std::size_t>(config_.max_units);
}

const Unit& Security::openUnit(Direction direction, double price,
                               Timestamp time, std::size_t tick,
                               int unit_size) {
  if (isLoaded()) {
    throw InvariantViolation("security \"" + config_.name +
                             "\": openUnit beyond max_units=" +
                             std::to_string(config_.max_units));
  }

  domain::UnitTerms terms;
  terms.direction = direction;
  terms.security = config_.name;
  terms.entry_price = price;
  terms.entry_time = time;
  terms.entry_tick = tick;
  terms.atr = entryAtr(direction);
  terms.unit_size = unit_size;
  terms.lot_size = config_.lot_size;
  terms.margin_factor = config_.margin_factor;
  terms.stop_loss_factor = config_.stop_loss_factor;

  auto& units = mutablePositions(direction);
  units.emplace_back(std::move(terms));
  return units.back();
}

Unit Security::removeUnit(Direction direction, std::size_t index) {
  auto& units = mutablePositions(direction);
  if (index >= units.size()) {
    throw InvariantViolation("security \"" + config_.name +
                             "\": removeUnit index " + std::to_string(index) +
                             " out of range (" +
                             std::to_string(units.size()) + " open)");
  }
  auto it = units.begin() + static_cast<std::ptrdiff_t>(index);
  Unit unit = std::move(*it);
  units.erase(it);
  return unit;
}

void Security::recenterStops(Direction direction, double adjust_atr_factor) {
  auto& units = mutablePositions(direction);
  const double sign = domain::directionSign(direction);
  const std::size_t count = units.size();
  for (std::size_t i = 0; i < count; ++i) {
    const auto rank = static_cast<double>(count - 1 - i);
    Unit& unit = units[i];
    unit.setStopPrice(unit.originalStopPrice() +
                      sign * adjust_atr_factor * unit.atr() * rank);
  }
}

std::vector<std::size_t> Security::stoppedOutIndices(Direction direction,
                                                     double price) const {
  std::vector<std::size_t> hit;
  const auto& units = positions(direction);
  for (std::size_t i = 0; i < units.size(); ++i) {
    if (units[i].isStoppedOut(price)) {
      hit.push_back(i);
    }
  }
  return hit;
}

// -----------------------------------------------------------------------------
// evaluateClose: P&L and costs of closing `unit` at `exit_price`
// -----------------------------------------------------------------------------
TradeOutcome Security::evaluateClose(const Unit& unit,
                                     double exit_price) const {
  const double sign = domain::directionSign(unit.direction());
  const double contracts =
      static_cast<double>(unit.unitSize()) * unit.lotSize();
  const double slip = config_.slippage_per_contract;

  TradeOutcome outcome;
  outcome.gross_profit = sign * (exit_price - unit.entryPrice()) * contracts;
  outcome.slippage_cost = 2.0 * slip * contracts;

  const double entry_leg = (unit.entryPrice() + sign * slip) * contracts;
  const double exit_leg = (exit_price - sign * slip) * contracts;
  outcome.transaction_cost =
      config_.transaction_cost_rate * (entry_leg + exit_leg);

  outcome.net_profit = outcome.gross_profit - outcome.slippage_cost -
                       outcome.transaction_cost;
  return outcome;
}

double Security::openMargin() const {
  double total = 0.0;
  for (const auto& unit : long_positions_) {
    total += unit.marginReq();
  }
  for (const auto& unit : short_positions_) {
    total += unit.marginReq();
  }
  return total;
}

std::string Security::quickSummary() const {
  return std::to_string(long_positions_.size()) + "L " +
         std::to_string(short_positions_.size()) + "S";
}

}  // namespace trendsim
