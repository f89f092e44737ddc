#include "trendsim/domain/config.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace trendsim {
namespace domain {

namespace {

void require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::invalid_argument(message);
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// usesMacd
// -----------------------------------------------------------------------------
bool PortfolioConfig::usesMacd() const {
  return entry_type != EntryType::Breakout ||
         exit_type == ExitType::MacdSignalCrossover ||
         use_macd_signal_condition || use_polarity_condition;
}

// -----------------------------------------------------------------------------
// minWarmupLength
// -----------------------------------------------------------------------------
std::size_t PortfolioConfig::minWarmupLength() const {
  int longest = atr_average_range;

  if (entry_type == EntryType::Breakout) {
    longest = std::max({longest, long_breakout, short_breakout});
  }
  if (exit_type == ExitType::Breakout) {
    longest = std::max({longest, exit_long_breakout, exit_short_breakout});
  }
  if (usesMacd()) {
    longest = std::max(longest, macd.slow_length + macd.signal_length);
  }

  return static_cast<std::size_t>(longest) + 1;
}

// -----------------------------------------------------------------------------
// validate
// -----------------------------------------------------------------------------
void PortfolioConfig::validate() const {
  require(long_breakout >= 1, "long_breakout must be >= 1");
  require(short_breakout >= 1, "short_breakout must be >= 1");
  require(exit_long_horizon >= 0, "exit_long_horizon must be >= 0");
  require(exit_short_horizon >= 0, "exit_short_horizon must be >= 0");
  require(exit_long_breakout >= 1, "exit_long_breakout must be >= 1");
  require(exit_short_breakout >= 1, "exit_short_breakout must be >= 1");
  require(extra_unit_atr_factor >= 0.0, "extra_unit_atr_factor must be >= 0");
  require(adjust_stop_atr_factor >= 0.0,
          "adjust_stop_atr_factor must be >= 0");
  require(stop_loss_factor >= 0.0, "stop_loss_factor must be >= 0");
  require(notional_account_size > 0.0,
          "notional_account_size must be positive");
  require(risk_percent_of_account >= 0.0,
          "risk_percent_of_account must be >= 0");
  require(max_position_limit_each_way >= 0,
          "max_position_limit_each_way must be >= 0");
  require(!max_margin_per_trade || *max_margin_per_trade >= 0.0,
          "max_margin_per_trade must be >= 0");
  require(margin_factor > 0.0, "margin_factor must be positive");
  require(atr_average_range >= 1, "atr_average_range must be >= 1");
  require(max_units >= 0, "max_units must be >= 0");
  require(lot_size >= 1, "lot_size must be >= 1");
  require(transaction_cost_rate >= 0.0, "transaction_cost_rate must be >= 0");
  require(slippage_per_contract >= 0.0, "slippage_per_contract must be >= 0");

  if (usesMacd()) {
    require(macd.fast_length >= 1, "macd.fast must be >= 1");
    require(macd.signal_length >= 1, "macd.signal must be >= 1");
    require(macd.fast_length < macd.slow_length,
            "macd.fast must be shorter than macd.slow");
    require(macd.smoothing >= 0.0, "macd.smoothing must be >= 0");
  }
}

// -----------------------------------------------------------------------------
// resolveSecurityConfig
// -----------------------------------------------------------------------------
SecurityConfig resolveSecurityConfig(const PortfolioConfig& portfolio,
                                     const SecurityOverrides& overrides) {
  require(!overrides.name.empty(), "security name must not be empty");

  SecurityConfig config;
  config.name = overrides.name;
  config.lot_size = overrides.lot_size.value_or(portfolio.lot_size);
  config.max_units = overrides.max_units.value_or(portfolio.max_units);
  config.atr_average_range =
      overrides.atr_average_range.value_or(portfolio.atr_average_range);
  config.stop_loss_factor =
      overrides.stop_loss_factor.value_or(portfolio.stop_loss_factor);
  config.transaction_cost_rate =
      overrides.transaction_cost_rate.value_or(portfolio.transaction_cost_rate);
  config.slippage_per_contract =
      overrides.slippage_per_contract.value_or(portfolio.slippage_per_contract);
  config.margin_factor =
      overrides.margin_factor.value_or(portfolio.margin_factor);
  if (portfolio.usesMacd()) {
    config.macd = portfolio.macd;
  }

  const std::string prefix = "security \"" + config.name + "\": ";
  require(config.lot_size >= 1, prefix + "lot_size must be >= 1");
  require(config.max_units >= 0, prefix + "max_units must be >= 0");
  require(config.atr_average_range >= 1,
          prefix + "atr_average_range must be >= 1");
  require(config.stop_loss_factor >= 0.0,
          prefix + "stop_loss_factor must be >= 0");
  require(config.transaction_cost_rate >= 0.0,
          prefix + "transaction_cost_rate must be >= 0");
  require(config.slippage_per_contract >= 0.0,
          prefix + "slippage_per_contract must be >= 0");
  require(config.margin_factor > 0.0, prefix + "margin_factor must be positive");

  return config;
}

}  // namespace domain
}  // namespace trendsim
