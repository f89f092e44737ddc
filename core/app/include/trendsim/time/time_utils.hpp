#pragma once

#include <chrono>
#include <cstdint>

namespace trendsim {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Type alias for the time of a price point. Every tick, Unit and ledger row
// carries one. std::chrono::system_clock::time_point keeps arithmetic
// type-safe; the wire and report formats use epoch milliseconds.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// Tick files and reports carry epoch milliseconds; these two functions are
// the only crossing points.
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

// Truncates to whole milliseconds. Trade ids are built from this value, so
// it alone does not separate a long and a short unit opened on the same
// tick; makeTradeId() appends the direction for that.
inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace trendsim
