#pragma once

namespace trendsim {
namespace domain {

// -----------------------------------------------------------------------------
// Direction
// -----------------------------------------------------------------------------
// Responsibility: Encodes the side of a Unit (long or short).
// Every per-direction decision in the engine (sizing snapshot, stop side,
// breakout comparison, position counters) branches on this value.
// -----------------------------------------------------------------------------
enum class Direction {
  Long,
  Short,
};

inline const char* directionToString(Direction d) {
  switch (d) {
    case Direction::Long:  return "Long";
    case Direction::Short: return "Short";
  }
  return "Unknown";
}

// +1 for long, -1 for short. P&L and stop placement both collapse to
// expressions scaled by this sign.
inline double directionSign(Direction d) {
  return d == Direction::Long ? 1.0 : -1.0;
}

}  // namespace domain
}  // namespace trendsim
