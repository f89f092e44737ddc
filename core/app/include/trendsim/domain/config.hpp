#pragma once

#include "trendsim/domain/policy.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace trendsim {
namespace domain {

// -----------------------------------------------------------------------------
// MacdParams
// -----------------------------------------------------------------------------
// Lengths (in ticks) of the fast EMA, slow EMA and the Signal EMA of MACD,
// plus the EMA smoothing numerator (2 gives the classic 2/(n+1) weight).
// -----------------------------------------------------------------------------
struct MacdParams {
  int fast_length{12};
  int slow_length{26};
  int signal_length{9};
  double smoothing{2.0};
};

// -----------------------------------------------------------------------------
// PortfolioConfig: every policy switch and numeric parameter of a run
// -----------------------------------------------------------------------------
//
// @brief  Immutable configuration of a simulation. Portfolio-wide policy plus
//         the defaults each Security inherits unless overridden.
//
// @details
// Loaded from JSON by config_loader (every key optional, defaults below) or
// built directly in code and tests. validate() rejects out-of-range values
// with std::invalid_argument; Portfolio calls it on construction.
//
// Lengths, horizons and windows are counted in ticks.
//
// Thread model:
//   Plain value type. Copied into the Portfolio at construction.
// -----------------------------------------------------------------------------
struct PortfolioConfig {
  // --- Entry ----------------------------------------------------------------
  EntryType entry_type{EntryType::Breakout};
  int long_breakout{20};
  int short_breakout{20};
  bool long_at_high{true};  // false: long at the low, short at the high
  bool use_macd_signal_condition{false};
  bool use_polarity_condition{false};
  MacdParams macd;

  // --- Additional units -----------------------------------------------------
  ExtraUnitPolicy extra_units{ExtraUnitPolicy::No};
  double extra_unit_atr_factor{0.5};
  bool adjust_stops_on_more_units{true};
  double adjust_stop_atr_factor{0.5};

  // --- Stops ----------------------------------------------------------------
  bool use_stops{true};
  double stop_loss_factor{2.0};

  // --- Exit -----------------------------------------------------------------
  ExitType exit_type{ExitType::Timed};
  int exit_long_horizon{80};
  int exit_short_horizon{80};
  int exit_long_breakout{80};
  int exit_short_breakout{80};

  // --- Account and risk -----------------------------------------------------
  double notional_account_size{100000.0};
  bool compound_account_size{false};  // re-base on every closed trade
  double risk_percent_of_account{1.0};
  int max_position_limit_each_way{12};
  std::optional<double> max_margin_per_trade;  // unset: no margin cap

  // --- Security defaults ----------------------------------------------------
  double margin_factor{1.0};
  int atr_average_range{20};
  int max_units{4};
  int lot_size{15};
  double transaction_cost_rate{0.0};
  double slippage_per_contract{0.0};

  bool log_trades{false};

  // True when any entry, exit or modifier needs MACD/Signal.
  bool usesMacd() const;

  // Number of leading price points that must be consumed as warm-up before
  // the first simulated tick: the longest window any enabled indicator or
  // rolling high/low needs, plus one.
  std::size_t minWarmupLength() const;

  void validate() const;
};

// -----------------------------------------------------------------------------
// SecurityOverrides
// -----------------------------------------------------------------------------
// Per-security exceptions to the PortfolioConfig defaults. Unset fields
// inherit. Typical use is the per-security lot-size mapping.
// -----------------------------------------------------------------------------
struct SecurityOverrides {
  std::string name;
  std::optional<int> lot_size;
  std::optional<int> max_units;
  std::optional<int> atr_average_range;
  std::optional<double> stop_loss_factor;
  std::optional<double> transaction_cost_rate;
  std::optional<double> slippage_per_contract;
  std::optional<double> margin_factor;
};

// -----------------------------------------------------------------------------
// SecurityConfig
// -----------------------------------------------------------------------------
// Fully-resolved settings of one Security. A Security never looks anything
// up on its Portfolio; everything it needs is in here.
// -----------------------------------------------------------------------------
struct SecurityConfig {
  std::string name;
  int lot_size{15};
  int max_units{4};
  int atr_average_range{20};
  double stop_loss_factor{2.0};
  double transaction_cost_rate{0.0};
  double slippage_per_contract{0.0};
  double margin_factor{1.0};
  std::optional<MacdParams> macd;  // set only when MACD policies are in use
};

// Merges overrides onto the portfolio defaults and validates the result.
SecurityConfig resolveSecurityConfig(const PortfolioConfig& portfolio,
                                     const SecurityOverrides& overrides);

}  // namespace domain
}  // namespace trendsim
