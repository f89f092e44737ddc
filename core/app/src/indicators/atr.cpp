#include "trendsim/indicators/atr.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace trendsim {
namespace indicators {

double initATR(const std::vector<double>& prices, int window) {
  if (window < 1) {
    throw std::invalid_argument("ATR window must be >= 1, got " +
                                std::to_string(window));
  }
  const auto needed = static_cast<std::size_t>(window) + 1;
  if (prices.size() < needed) {
    throw std::invalid_argument(
        "ATR warm-up needs " + std::to_string(needed) + " prices, got " +
        std::to_string(prices.size()));
  }

  // Seed: simple mean of the first `window` true ranges.
  double sum = 0.0;
  for (std::size_t i = 1; i < needed; ++i) {
    sum += std::abs(prices[i] - prices[i - 1]);
  }
  double atr = sum / window;

  for (std::size_t i = needed; i < prices.size(); ++i) {
    atr = stepATR(atr, prices[i - 1], prices[i], window);
  }
  return atr;
}

double stepATR(double prev_atr, double prev_price, double curr_price,
               int window) {
  const double true_range = std::abs(curr_price - prev_price);
  return ((window - 1) * prev_atr + true_range) / window;
}

}  // namespace indicators
}  // namespace trendsim
