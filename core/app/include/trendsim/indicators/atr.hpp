#pragma once

#include <vector>

namespace trendsim {
namespace indicators {

// -----------------------------------------------------------------------------
// Average True Range
// -----------------------------------------------------------------------------
//
// @brief  Wilder-smoothed average of the absolute tick-to-tick price move.
//
// @details
// On a single price stream the true range of tick i is |p[i] - p[i-1]|.
//
//   Warm-up:  ATR = mean(TR[1..window])
//   Step:     ATR = ((window - 1) * ATR + TR) / window
//
// initATR() applies stepATR() for every point after the first window, so a
// warm-up over a prefix followed by per-tick steps produces exactly the same
// double as a warm-up over the whole series.
// -----------------------------------------------------------------------------

// -------------------------------------------------------------------------
// initATR(prices, window)
// -------------------------------------------------------------------------
// @param  prices  Price history, oldest first. Needs window + 1 points.
// @param  window  Averaging window in ticks (>= 1).
// @return The ATR after the last price.
//
// Throws std::invalid_argument on window < 1 or a short history.
// -------------------------------------------------------------------------
double initATR(const std::vector<double>& prices, int window);

// -------------------------------------------------------------------------
// stepATR(prev_atr, prev_price, curr_price, window)
// -------------------------------------------------------------------------
// One incremental update. O(1), no history needed.
// -------------------------------------------------------------------------
double stepATR(double prev_atr, double prev_price, double curr_price,
               int window);

}  // namespace indicators
}  // namespace trendsim
