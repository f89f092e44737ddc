#pragma once

#include "trendsim/domain/direction.hpp"
#include "trendsim/domain/policy.hpp"
#include "trendsim/time/time_utils.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace trendsim {

// -----------------------------------------------------------------------------
// LedgerExit
// -----------------------------------------------------------------------------
// Closing half of a ledger row. Written exactly once, when the Unit closes.
// -----------------------------------------------------------------------------
struct LedgerExit {
  std::size_t exit_tick{0};
  Timestamp exit_time{};
  double exit_price{0.0};
  domain::ExitKind kind{domain::ExitKind::Exit};
  std::optional<double> breakout_threshold;  // breakout exits only
  double gross_profit{0.0};
  double slippage_cost{0.0};
  double transaction_cost{0.0};
  double net_profit{0.0};
  double exit_atr{0.0};
};

// -----------------------------------------------------------------------------
// LedgerRow: audit record of one Unit
// -----------------------------------------------------------------------------
//
// @brief  Entry terms and account snapshot captured when the Unit opened,
//         plus the exit section once it closed.
//
// @details
// The account snapshot (equity, notional account size, open margin, the
// security's position summary) is taken right after the Unit was added, so
// open_margin and security_summary already include it.
// -----------------------------------------------------------------------------
struct LedgerRow {
  std::string trade_id;
  std::string security;
  domain::Direction direction{domain::Direction::Long};

  std::size_t entry_tick{0};
  Timestamp entry_time{};
  double entry_price{0.0};
  int unit_size{0};
  int lot_size{0};
  double entry_atr{0.0};
  double initial_stop_price{0.0};
  double margin_req{0.0};

  // --- Account snapshot at entry --------------------------------------------
  double equity{0.0};
  double notional_account_size{0.0};
  double open_margin{0.0};
  std::string security_summary;

  std::optional<LedgerExit> exit;

  bool isClosed() const { return exit.has_value(); }
};

}  // namespace trendsim
