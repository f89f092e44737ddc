#pragma once

#include "trendsim/domain/price_series.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace trendsim {

// -----------------------------------------------------------------------------
// SymbolSeries: one symbol's prices as read from the tick file
// -----------------------------------------------------------------------------
struct SymbolSeries {
  std::string symbol;
  domain::PriceSeries series;  // strictly increasing time
};

// -----------------------------------------------------------------------------
// AlignOptions
// -----------------------------------------------------------------------------
//   warmup_length          leading aligned rows handed to the Securities as
//                          warm-up (PortfolioConfig::minWarmupLength())
//   contiguous_interval_ms when set, keep only the longest run of aligned
//                          rows spaced exactly this far apart
// -----------------------------------------------------------------------------
struct AlignOptions {
  std::size_t warmup_length{0};
  std::optional<std::int64_t> contiguous_interval_ms{1000};
};

// -----------------------------------------------------------------------------
// Tick ingestion
// -----------------------------------------------------------------------------
//
// @brief  Turns a JSON-Lines file of market data messages into the aligned
//         warm-up series and tick table the Portfolio consumes.
//
// @details
// Each line has the engine's market data wire shape:
//
//   {"timestamp_ms": 1700000000000, "symbol": "sec_0", "price": 101.25}
//
// Pipeline:
//   1. readTickMessages()    parse, group per symbol (first-appearance
//                            order), sort by time. Prices lose their sign.
//                            Malformed lines, zero or non-finite prices and
//                            duplicate timestamps are logged and skipped.
//   2. alignSeries()         inner join on timestamp, optional contiguous
//                            run, warm-up split.
//
// Warm-up and ticks never share a row: warmup holds rows
// [0, warmup_length) and ticks the rest.
// -----------------------------------------------------------------------------
std::vector<SymbolSeries> readTickMessages(std::istream& in,
                                           const std::string& source);

domain::MarketData alignSeries(const std::vector<SymbolSeries>& symbols,
                               const AlignOptions& options);

// -----------------------------------------------------------------------------
// retainLongestContiguousRun(times, interval_ms)
// -----------------------------------------------------------------------------
// Returns the half-open index range [first, last) of the longest run of
// `times` in which every consecutive pair is exactly interval_ms apart. The
// earliest run wins a tie. Empty input gives {0, 0}; a single row is a run
// of length one.
// -----------------------------------------------------------------------------
std::pair<std::size_t, std::size_t> retainLongestContiguousRun(
    const std::vector<Timestamp>& times, std::int64_t interval_ms);

// Opens `path` and runs the whole pipeline. Throws std::invalid_argument if
// the file cannot be opened or too few aligned rows remain for the warm-up
// plus at least one tick.
domain::MarketData loadMarketData(const std::string& path,
                                  const AlignOptions& options);

}  // namespace trendsim
