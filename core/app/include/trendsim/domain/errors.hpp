#pragma once

#include <stdexcept>
#include <string>

namespace trendsim {

// -----------------------------------------------------------------------------
// InvariantViolation
// -----------------------------------------------------------------------------
// Thrown when the books disagree with themselves: portfolio counters that no
// longer match the per-security lists, an open-margin total that drifted
// from the open Units, or a ledger row created or closed twice. These are
// programming errors; the simulation stops instead of continuing on
// inconsistent state.
// -----------------------------------------------------------------------------
class InvariantViolation : public std::logic_error {
 public:
  explicit InvariantViolation(const std::string& what)
      : std::logic_error(what) {}
};

}  // namespace trendsim
