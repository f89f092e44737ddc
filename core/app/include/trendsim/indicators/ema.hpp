#pragma once

#include "trendsim/domain/config.hpp"

#include <vector>

namespace trendsim {
namespace indicators {

// -------------------------------------------------------------------------
// stepEMA(prev_ema, length, smoothing, price)
// -------------------------------------------------------------------------
// @brief  One exponential-moving-average update.
//
// @details
//   multiplier = smoothing / (length + 1)
//   EMA        = price * multiplier + prev_ema * (1 - multiplier)
//
// smoothing == 0 leaves prev_ema unchanged. length >= 1 is the caller's
// contract (validated with the configuration), so the denominator is never
// zero.
// -------------------------------------------------------------------------
double stepEMA(double prev_ema, int length, double smoothing, double price);

// -------------------------------------------------------------------------
// initEMA(prices, length, smoothing)
// -------------------------------------------------------------------------
// @brief  Batch EMA: seed with the mean of the first `length` prices, then
//         stepEMA() over the rest.
//
// Throws std::invalid_argument on length < 1 or fewer than `length` prices.
// -------------------------------------------------------------------------
double initEMA(const std::vector<double>& prices, int length,
               double smoothing = 2.0);

// -----------------------------------------------------------------------------
// MacdState
// -----------------------------------------------------------------------------
// Indicator scalars of one security after the latest tick, plus the MACD and
// Signal of the tick before it for crossover detection. A "previous" value
// that does not exist yet is NaN; every comparison against NaN is false, so
// a crossover cannot fire before both ticks are defined.
// -----------------------------------------------------------------------------
struct MacdState {
  double ema_fast{0.0};
  double ema_slow{0.0};
  double macd{0.0};
  double signal{0.0};
  double prev_macd{0.0};
  double prev_signal{0.0};
};

// -------------------------------------------------------------------------
// initMACD(prices, params)
// -------------------------------------------------------------------------
// @brief  Batch warm-up of EMA_fast, EMA_slow, MACD and Signal.
//
// @details
// EMA_fast and EMA_slow are seeded at indices fast-1 and slow-1. The first
// MACD value is the one at index slow-1. Signal is seeded with the mean of
// the first `signal_length` MACD values (index slow + signal - 2) and then
// stepped. Everything after the Signal seed goes through stepMACD().
//
// Needs slow_length + signal_length - 1 prices; throws
// std::invalid_argument otherwise or on inconsistent lengths.
// -------------------------------------------------------------------------
MacdState initMACD(const std::vector<double>& prices,
                   const domain::MacdParams& params);

// -------------------------------------------------------------------------
// stepMACD(state, price, params)
// -------------------------------------------------------------------------
// One incremental update of all four scalars; the current MACD/Signal move
// into prev_macd/prev_signal.
// -------------------------------------------------------------------------
MacdState stepMACD(const MacdState& state, double price,
                   const domain::MacdParams& params);

}  // namespace indicators
}  // namespace trendsim
