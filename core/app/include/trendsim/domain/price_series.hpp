#pragma once

#include "trendsim/time/time_utils.hpp"

#include <string>
#include <vector>

namespace trendsim {
namespace domain {

// -----------------------------------------------------------------------------
// PricePoint / PriceSeries
// -----------------------------------------------------------------------------
// Responsibility: One observed (timestamp, price) pair and the ordered
// history of them for a single security.
//
// A Security owns its PriceSeries. It starts as the warm-up prefix and grows
// by exactly one point at the end of every simulated tick, so during a tick
// the series holds only strictly prior prices.
// -----------------------------------------------------------------------------
struct PricePoint {
  Timestamp time{};
  double price{0.0};
};

using PriceSeries = std::vector<PricePoint>;

// Extracts the price column. Indicator warm-up works on plain prices.
inline std::vector<double> pricesOf(const PriceSeries& series) {
  std::vector<double> prices;
  prices.reserve(series.size());
  for (const auto& point : series) {
    prices.push_back(point.price);
  }
  return prices;
}

// -----------------------------------------------------------------------------
// Tick / TickTable
// -----------------------------------------------------------------------------
// Responsibility: One row of aligned market data: a timestamp and one price
// per security, in the Portfolio's security order. The simulation consumes
// a TickTable front to back.
// -----------------------------------------------------------------------------
struct Tick {
  Timestamp time{};
  std::vector<double> prices;
};

using TickTable = std::vector<Tick>;

// -----------------------------------------------------------------------------
// MarketData
// -----------------------------------------------------------------------------
// Responsibility: Output of ingestion. `names[i]` and `warmup[i]` describe
// security i; every Tick in `ticks` carries names.size() prices.
// -----------------------------------------------------------------------------
struct MarketData {
  std::vector<std::string> names;
  std::vector<PriceSeries> warmup;
  TickTable ticks;
};

}  // namespace domain
}  // namespace trendsim
