#include "trendsim/engine/portfolio.hpp"
#include "trendsim/domain/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace trendsim {

using domain::Direction;
using domain::EntryType;
using domain::ExitKind;
using domain::ExitType;
using domain::ExtraUnitPolicy;

namespace {

constexpr Direction kDirections[] = {Direction::Long, Direction::Short};

// Margin is added and subtracted in doubles; the running total may drift
// from the recomputed sum by rounding only.
bool nearlyEqual(double a, double b) {
  const double scale = std::max({1.0, std::fabs(a), std::fabs(b)});
  return std::fabs(a - b) <= 1e-9 * scale;
}

std::size_t toLength(int ticks) { return static_cast<std::size_t>(ticks); }

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
Portfolio::Portfolio(domain::PortfolioConfig config)
    : config_(std::move(config)) {
  config_.validate();
  initial_notional_ = config_.notional_account_size;
  notional_account_size_ = config_.notional_account_size;
  equity_ = config_.notional_account_size;
}

// -----------------------------------------------------------------------------
// addSecurity()
// -----------------------------------------------------------------------------
Security& Portfolio::addSecurity(const domain::SecurityOverrides& overrides,
                                 domain::PriceSeries warmup) {
  if (ticks_processed_ > 0 || isFinished()) {
    throw std::logic_error("cannot add security \"" + overrides.name +
                           "\" after the simulation started");
  }
  for (const auto& existing : securities_) {
    if (existing->name() == overrides.name) {
      throw std::invalid_argument("duplicate security \"" + overrides.name +
                                  "\"");
    }
  }

  domain::SecurityConfig resolved =
      domain::resolveSecurityConfig(config_, overrides);
  securities_.push_back(
      std::make_unique<Security>(std::move(resolved), std::move(warmup)));
  return *securities_.back();
}

void Portfolio::setTradeClosedSink(TradeClosedSink sink) {
  trade_closed_sink_ = std::move(sink);
}

std::size_t Portfolio::numPositions(Direction direction) const {
  return direction == Direction::Long ? num_long_positions_
                                      : num_short_positions_;
}

const Security& Portfolio::security(std::size_t index) const {
  return *securities_.at(index);
}

// -----------------------------------------------------------------------------
// processTick(): the six steps of one tick
// -----------------------------------------------------------------------------
void Portfolio::processTick(const domain::Tick& tick) {
  if (isFinished()) {
    throw std::logic_error("processTick() after finish()");
  }
  tick_index_ = ticks_processed_;
  validateTick(tick);
  tick_time_ = tick.time;

  // ---  1) Indicators ----------------------------------------------------------
  for (std::size_t i = 0; i < securities_.size(); ++i) {
    securities_[i]->updateIndicators(tick.prices[i]);
  }

  // ---  2) Unit sizes ----------------------------------------------------------
  for (auto& security : securities_) {
    security->updateUnitSize(config_.risk_percent_of_account,
                             notional_account_size_);
  }

  // ---  3) Stops ---------------------------------------------------------------
  if (config_.use_stops) {
    for (std::size_t i = 0; i < securities_.size(); ++i) {
      applyStops(tick.prices[i], *securities_[i]);
    }
  }

  // ---  4) Exits ---------------------------------------------------------------
  for (std::size_t i = 0; i < securities_.size(); ++i) {
    applyExits(tick.prices[i], *securities_[i]);
  }

  // ---  5) Entries: long across all securities, then short -------------------
  applyEntries(Direction::Long, tick);
  applyEntries(Direction::Short, tick);

  // ---  6) History -------------------------------------------------------------
  for (std::size_t i = 0; i < securities_.size(); ++i) {
    securities_[i]->appendPrice(tick.time, tick.prices[i]);
  }

  ++ticks_processed_;
  checkInvariants();
}

// -----------------------------------------------------------------------------
// finish(): exit all, then freeze statistics
// -----------------------------------------------------------------------------
const SimulationStats& Portfolio::finish() {
  if (isFinished()) {
    return *stats_;
  }

  if (ticks_processed_ > 0) {
    tick_index_ = ticks_processed_ - 1;
  }
  for (auto& security : securities_) {
    if (ticks_processed_ == 0) {
      tick_time_ = security->lastTime();
    }
    for (Direction direction : kDirections) {
      closeAll(*security, direction, security->lastPrice(), ExitKind::ExitAll,
               std::nullopt);
    }
  }
  checkInvariants();

  SimulationStats stats = book_.summarize();
  stats.peak_margin = peak_margin_;
  stats.peak_margin_time = peak_margin_time_;
  stats_ = stats;
  return *stats_;
}

// -----------------------------------------------------------------------------
// run()
// -----------------------------------------------------------------------------
const SimulationStats& Portfolio::run(const domain::TickTable& ticks,
                                      const ProgressSink& progress) {
  std::cout << "[Portfolio] run started: " << securities_.size()
            << " securities, " << ticks.size() << " ticks, entry="
            << domain::entryTypeToString(config_.entry_type)
            << " exit=" << domain::exitTypeToString(config_.exit_type)
            << " extra_units="
            << domain::extraUnitPolicyToString(config_.extra_units) << "\n";

  const auto n = static_cast<double>(ticks.size());
  for (std::size_t t = 0; t < ticks.size(); ++t) {
    processTick(ticks[t]);

    if (progress) {
      try {
        progress(static_cast<double>(t + 1) / n);
      } catch (const std::exception& e) {
        std::cerr << "[Portfolio] WARNING: progress sink failed at tick " << t
                  << ": " << e.what() << "\n";
      }
    }
  }

  if (config_.log_trades) {
    std::cout << "[Portfolio] end of data\n" << describePositions();
  }
  const SimulationStats& stats = finish();
  std::cout << "[Portfolio] run finished: " << stats.num_trades
            << " trades, net profit " << stats.total_net_profit
            << ", peak margin " << stats.peak_margin << "\n";
  return stats;
}

// -----------------------------------------------------------------------------
// validateTick()
// -----------------------------------------------------------------------------
void Portfolio::validateTick(const domain::Tick& tick) const {
  const std::string where = "tick " + std::to_string(tick_index_) + ": ";
  if (securities_.empty()) {
    throw std::invalid_argument(where + "portfolio has no securities");
  }
  if (tick.prices.size() != securities_.size()) {
    throw std::invalid_argument(
        where + "expected " + std::to_string(securities_.size()) +
        " prices, got " + std::to_string(tick.prices.size()));
  }
  for (std::size_t i = 0; i < tick.prices.size(); ++i) {
    const double price = tick.prices[i];
    if (!std::isfinite(price) || price <= 0.0) {
      std::ostringstream msg;
      msg << where << "invalid price " << price << " for security \""
          << securities_[i]->name() << "\"";
      throw std::invalid_argument(msg.str());
    }
    if (tick.time <= securities_[i]->lastTime()) {
      throw std::invalid_argument(
          where + "timestamp " + std::to_string(timestamp_to_ms(tick.time)) +
          " is not after the last price of \"" + securities_[i]->name() +
          "\"");
    }
  }
}

// -----------------------------------------------------------------------------
// applyStops(): reverse index so earlier indices stay valid
// -----------------------------------------------------------------------------
void Portfolio::applyStops(double price, Security& security) {
  for (Direction direction : kDirections) {
    const auto hits = security.stoppedOutIndices(direction, price);
    for (auto it = hits.rbegin(); it != hits.rend(); ++it) {
      closeUnit(security, direction, *it, price, ExitKind::StopOut,
                std::nullopt);
    }
  }
}

// -----------------------------------------------------------------------------
// applyExits()
// -----------------------------------------------------------------------------
void Portfolio::applyExits(double price, Security& security) {
  for (Direction direction : kDirections) {
    if (!security.isEntered(direction)) {
      continue;
    }

    if (config_.exit_type == ExitType::Timed) {
      const auto horizon = toLength(direction == Direction::Long
                                        ? config_.exit_long_horizon
                                        : config_.exit_short_horizon);
      // Oldest first: only the front can have reached the horizon.
      while (security.isEntered(direction) &&
             tick_index_ - security.positions(direction).front().entryTick() >=
                 horizon) {
        closeUnit(security, direction, 0, price, ExitKind::Exit,
                  std::nullopt);
      }
      continue;
    }

    std::optional<double> threshold;
    if (exitTriggered(security, direction, price, threshold)) {
      closeAll(security, direction, price, ExitKind::Exit, threshold);
    }
  }
}

// -----------------------------------------------------------------------------
// exitTriggered(): whole-direction exits (Breakout, MACD signal crossover)
// -----------------------------------------------------------------------------
bool Portfolio::exitTriggered(const Security& security, Direction direction,
                              double price,
                              std::optional<double>& threshold) const {
  switch (config_.exit_type) {
    case ExitType::Timed:
      return false;

    case ExitType::Breakout: {
      const bool is_long = direction == Direction::Long;
      const auto range = security.priorRange(toLength(
          is_long ? config_.exit_long_breakout : config_.exit_short_breakout));
      if (!range) {
        return false;
      }
      if (is_long && price < range->low) {
        threshold = range->low;
        return true;
      }
      if (!is_long && price > range->high) {
        threshold = range->high;
        return true;
      }
      return false;
    }

    case ExitType::MacdSignalCrossover:
      // Longs leave when MACD crosses below Signal, shorts when it crosses
      // above: the opposite direction's entry crossing.
      return security.macdSignalCrossed(direction == Direction::Long
                                            ? Direction::Short
                                            : Direction::Long);
  }
  return false;
}

// -----------------------------------------------------------------------------
// entryTriggered(): base family plus the optional MACD modifiers
// -----------------------------------------------------------------------------
bool Portfolio::entryTriggered(const Security& security, Direction direction,
                               double price) const {
  bool triggered = false;
  switch (config_.entry_type) {
    case EntryType::Breakout:
      triggered = security.breakoutEntry(
          direction, price,
          toLength(direction == Direction::Long ? config_.long_breakout
                                                : config_.short_breakout),
          config_.long_at_high);
      break;
    case EntryType::MacdSignalCrossover:
      triggered = security.macdSignalCrossed(direction);
      break;
    case EntryType::MacdZeroCrossover:
      triggered = security.macdZeroCrossed(direction);
      break;
  }

  if (triggered && config_.use_macd_signal_condition) {
    triggered = security.macdSignalAgrees(direction);
  }
  if (triggered && config_.use_polarity_condition) {
    triggered = security.signalPolarityAgrees(direction);
  }
  return triggered;
}

// -----------------------------------------------------------------------------
// applyEntries()
// -----------------------------------------------------------------------------
void Portfolio::applyEntries(Direction direction, const domain::Tick& tick) {
  const auto limit = toLength(config_.max_position_limit_each_way);

  for (std::size_t i = 0; i < securities_.size(); ++i) {
    Security& security = *securities_[i];
    const double price = tick.prices[i];

    // Both caps are checked before anything is created, and the portfolio
    // cap again for every security since earlier ones may have filled it.
    if (numPositions(direction) >= limit || security.isLoaded()) {
      continue;
    }

    const bool extra = security.isEntered(direction);
    bool fire = false;
    if (!extra) {
      fire = entryTriggered(security, direction, price);
    } else {
      switch (config_.extra_units) {
        case ExtraUnitPolicy::AsNewUnit:
          fire = entryTriggered(security, direction, price);
          break;
        case ExtraUnitPolicy::UsingAtr:
          fire = security.movedForExtraUnit(direction, price,
                                            config_.extra_unit_atr_factor);
          break;
        case ExtraUnitPolicy::No:
          fire = false;
          break;
      }
    }
    if (!fire) {
      continue;
    }

    security.updateUnitSize(config_.risk_percent_of_account,
                            notional_account_size_);
    const int unit_size =
        security.tradableUnitSize(price, config_.max_margin_per_trade);
    if (unit_size <= 0) {
      if (config_.log_trades) {
        std::cout << "[Portfolio] tick " << tick_index_ << ": skipped "
                  << domain::directionToString(direction) << " entry on "
                  << security.name() << " (tradable size 0, ATR "
                  << security.atr() << ")\n";
      }
      continue;
    }

    security.snapshotEntryAtr(direction);
    openUnit(security, direction, price, unit_size);

    if (extra && config_.extra_units == ExtraUnitPolicy::UsingAtr &&
        config_.adjust_stops_on_more_units) {
      security.recenterStops(direction, config_.adjust_stop_atr_factor);
    }
  }
}

// -----------------------------------------------------------------------------
// openUnit(): create the Unit, its ledger row and update the counters
// -----------------------------------------------------------------------------
void Portfolio::openUnit(Security& security, Direction direction, double price,
                         int unit_size) {
  // Checked before the Security or the counters change so a clash leaves
  // the books as they were.
  const std::string trade_id =
      domain::makeTradeId(security.name(), tick_time_, direction);
  if (book_.find(trade_id) != nullptr) {
    throw InvariantViolation("trade id \"" + trade_id + "\" already in use");
  }

  const domain::Unit& unit =
      security.openUnit(direction, price, tick_time_, tick_index_, unit_size);

  if (direction == Direction::Long) {
    ++num_long_positions_;
  } else {
    ++num_short_positions_;
  }
  margin_total_ += unit.marginReq();

  if (margin_total_ > peak_margin_) {
    peak_margin_ = margin_total_;
    peak_margin_time_ = tick_time_;
  }

  LedgerRow row;
  row.trade_id = unit.tradeId();
  row.security = security.name();
  row.direction = direction;
  row.entry_tick = tick_index_;
  row.entry_time = tick_time_;
  row.entry_price = price;
  row.unit_size = unit.unitSize();
  row.lot_size = unit.lotSize();
  row.entry_atr = unit.atr();
  row.initial_stop_price = unit.originalStopPrice();
  row.margin_req = unit.marginReq();
  row.equity = equity_;
  row.notional_account_size = notional_account_size_;
  row.open_margin = margin_total_;
  row.security_summary = security.quickSummary();
  book_.openRow(std::move(row));

  if (config_.log_trades) {
    std::cout << "[Portfolio] tick " << tick_index_ << ": OPEN "
              << unit.describe() << "\n";
  }
}

// -----------------------------------------------------------------------------
// closeUnit(): remove, settle, record
// -----------------------------------------------------------------------------
void Portfolio::closeUnit(Security& security, Direction direction,
                          std::size_t index, double price, ExitKind kind,
                          std::optional<double> breakout_threshold) {
  const domain::Unit unit = security.removeUnit(direction, index);
  const TradeOutcome outcome = security.evaluateClose(unit, price);

  if (direction == Direction::Long) {
    --num_long_positions_;
  } else {
    --num_short_positions_;
  }
  margin_total_ -= unit.marginReq();
  if (num_long_positions_ == 0 && num_short_positions_ == 0) {
    margin_total_ = 0.0;
  }

  cumulative_gross_profit_ += outcome.gross_profit;
  cumulative_net_profit_ += outcome.net_profit;
  equity_ = initial_notional_ + cumulative_net_profit_;
  if (config_.compound_account_size) {
    notional_account_size_ += outcome.net_profit;
  }

  LedgerExit exit;
  exit.exit_tick = tick_index_;
  exit.exit_time = tick_time_;
  exit.exit_price = price;
  exit.kind = kind;
  exit.breakout_threshold = breakout_threshold;
  exit.gross_profit = outcome.gross_profit;
  exit.slippage_cost = outcome.slippage_cost;
  exit.transaction_cost = outcome.transaction_cost;
  exit.net_profit = outcome.net_profit;
  exit.exit_atr = security.atr();
  const LedgerRow& row = book_.closeRow(unit.tradeId(), std::move(exit));

  if (config_.log_trades) {
    std::cout << "[Portfolio] tick " << tick_index_ << ": "
              << domain::exitKindToString(kind) << " " << unit.tradeId()
              << " " << domain::directionToString(direction) << " @ " << price
              << " net " << outcome.net_profit << "\n";
  }

  if (trade_closed_sink_) {
    try {
      trade_closed_sink_(row);
    } catch (const std::exception& e) {
      std::cerr << "[Portfolio] WARNING: trade sink failed for "
                << row.trade_id << ": " << e.what() << "\n";
    }
  }
}

void Portfolio::closeAll(Security& security, Direction direction, double price,
                         ExitKind kind,
                         const std::optional<double>& breakout_threshold) {
  while (security.isEntered(direction)) {
    closeUnit(security, direction, 0, price, kind, breakout_threshold);
  }
}

// -----------------------------------------------------------------------------
// checkInvariants()
// -----------------------------------------------------------------------------
void Portfolio::checkInvariants() const {
  std::size_t longs = 0;
  std::size_t shorts = 0;
  double margin = 0.0;
  for (const auto& security : securities_) {
    if (security->numTotalPositions() >
        static_cast<std::size_t>(security->config().max_units)) {
      throw InvariantViolation("security \"" + security->name() + "\" holds " +
                               std::to_string(security->numTotalPositions()) +
                               " units, max_units=" +
                               std::to_string(security->config().max_units));
    }
    longs += security->numLongPositions();
    shorts += security->numShortPositions();
    margin += security->openMargin();
  }

  const std::string where = "after tick " + std::to_string(tick_index_) + ": ";
  if (longs != num_long_positions_ || shorts != num_short_positions_) {
    throw InvariantViolation(
        where + "position counters " + std::to_string(num_long_positions_) +
        "L/" + std::to_string(num_short_positions_) +
        "S disagree with securities " + std::to_string(longs) + "L/" +
        std::to_string(shorts) + "S");
  }
  if (!nearlyEqual(margin, margin_total_)) {
    std::ostringstream msg;
    msg << where << "margin total " << margin_total_
        << " disagrees with open units " << margin;
    throw InvariantViolation(msg.str());
  }
  if (book_.numOpen() != longs + shorts) {
    throw InvariantViolation(where + std::to_string(book_.numOpen()) +
                             " open ledger rows for " +
                             std::to_string(longs + shorts) + " open units");
  }
}

// -----------------------------------------------------------------------------
// describePositions()
// -----------------------------------------------------------------------------
std::string Portfolio::describePositions() const {
  std::ostringstream out;
  out << "Positions " << num_long_positions_ << "L " << num_short_positions_
      << "S, margin " << margin_total_ << ", equity " << equity_ << "\n";
  for (const auto& security : securities_) {
    out << "  " << security->name() << " [" << security->quickSummary()
        << "] ATR " << security->atr() << " unit size "
        << security->unitSize() << "\n";
    for (Direction direction : kDirections) {
      for (const auto& unit : security->positions(direction)) {
        out << "    " << unit.describe() << "\n";
      }
    }
  }
  return out.str();
}

}  // namespace trendsim
