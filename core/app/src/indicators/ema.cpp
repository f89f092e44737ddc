#include "trendsim/indicators/ema.hpp"

#include <iterator>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

namespace trendsim {
namespace indicators {

namespace {

double meanOf(std::vector<double>::const_iterator first,
              std::vector<double>::const_iterator last) {
  const auto count = static_cast<double>(std::distance(first, last));
  return std::accumulate(first, last, 0.0) / count;
}

}  // namespace

// -----------------------------------------------------------------------------
// stepEMA
// -----------------------------------------------------------------------------
double stepEMA(double prev_ema, int length, double smoothing, double price) {
  const double multiplier = smoothing / (length + 1);
  return price * multiplier + prev_ema * (1.0 - multiplier);
}

// -----------------------------------------------------------------------------
// initEMA
// -----------------------------------------------------------------------------
double initEMA(const std::vector<double>& prices, int length,
               double smoothing) {
  if (length < 1) {
    throw std::invalid_argument("EMA length must be >= 1, got " +
                                std::to_string(length));
  }
  const auto seed_len = static_cast<std::size_t>(length);
  if (prices.size() < seed_len) {
    throw std::invalid_argument(
        "EMA warm-up needs " + std::to_string(seed_len) + " prices, got " +
        std::to_string(prices.size()));
  }

  double ema = meanOf(prices.begin(), prices.begin() + length);
  for (std::size_t i = seed_len; i < prices.size(); ++i) {
    ema = stepEMA(ema, length, smoothing, prices[i]);
  }
  return ema;
}

// -----------------------------------------------------------------------------
// initMACD
// -----------------------------------------------------------------------------
MacdState initMACD(const std::vector<double>& prices,
                   const domain::MacdParams& params) {
  const int fast = params.fast_length;
  const int slow = params.slow_length;
  const int sig = params.signal_length;
  const double s = params.smoothing;

  if (fast < 1 || sig < 1 || slow <= fast) {
    throw std::invalid_argument(
        "MACD lengths must satisfy 1 <= fast < slow and signal >= 1 (fast=" +
        std::to_string(fast) + ", slow=" + std::to_string(slow) +
        ", signal=" + std::to_string(sig) + ")");
  }
  const auto needed = static_cast<std::size_t>(slow + sig - 1);
  if (prices.size() < needed) {
    throw std::invalid_argument(
        "MACD warm-up needs " + std::to_string(needed) + " prices, got " +
        std::to_string(prices.size()));
  }

  // --- EMAs up to the slow seed (index slow - 1) ----------------------------
  double ema_fast = meanOf(prices.begin(), prices.begin() + fast);
  for (int i = fast; i < slow; ++i) {
    ema_fast = stepEMA(ema_fast, fast, s, prices[i]);
  }
  double ema_slow = meanOf(prices.begin(), prices.begin() + slow);

  // --- First `sig` MACD values, indices slow-1 .. slow+sig-2 -----------------
  std::vector<double> macd_values;
  macd_values.reserve(static_cast<std::size_t>(sig));
  macd_values.push_back(ema_fast - ema_slow);
  for (int i = slow; i < slow + sig - 1; ++i) {
    ema_fast = stepEMA(ema_fast, fast, s, prices[i]);
    ema_slow = stepEMA(ema_slow, slow, s, prices[i]);
    macd_values.push_back(ema_fast - ema_slow);
  }

  MacdState state;
  state.ema_fast = ema_fast;
  state.ema_slow = ema_slow;
  state.macd = macd_values.back();
  state.signal = meanOf(macd_values.cbegin(), macd_values.cend());
  state.prev_macd = macd_values.size() >= 2
                        ? macd_values[macd_values.size() - 2]
                        : std::numeric_limits<double>::quiet_NaN();
  state.prev_signal = std::numeric_limits<double>::quiet_NaN();

  for (std::size_t i = needed; i < prices.size(); ++i) {
    state = stepMACD(state, prices[i], params);
  }
  return state;
}

// -----------------------------------------------------------------------------
// stepMACD
// -----------------------------------------------------------------------------
MacdState stepMACD(const MacdState& state, double price,
                   const domain::MacdParams& params) {
  MacdState next;
  next.prev_macd = state.macd;
  next.prev_signal = state.signal;
  next.ema_fast =
      stepEMA(state.ema_fast, params.fast_length, params.smoothing, price);
  next.ema_slow =
      stepEMA(state.ema_slow, params.slow_length, params.smoothing, price);
  next.macd = next.ema_fast - next.ema_slow;
  next.signal =
      stepEMA(state.signal, params.signal_length, params.smoothing, next.macd);
  return next;
}

}  // namespace indicators
}  // namespace trendsim
