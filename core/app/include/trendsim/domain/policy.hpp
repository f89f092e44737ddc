#pragma once

#include <string>

namespace trendsim {
namespace domain {

// -----------------------------------------------------------------------------
// Policy axes
// -----------------------------------------------------------------------------
//
// @brief  Closed sets of strategy "modes". Each axis is selected once by
//         configuration and matched with a switch by the Portfolio; there is
//         no lookup of behaviour by name at run time.
//
// @details
// String names are the ones used in configuration files. parse*() rejects
// any other spelling with std::invalid_argument so an unknown mode can never
// fall back to a default silently.
// -----------------------------------------------------------------------------

// Entry family. Evaluated independently for long and short.
enum class EntryType {
  Breakout,             // price beyond the prior N-tick high/low
  MacdSignalCrossover,  // MACD crosses Signal
  MacdZeroCrossover,    // MACD crosses zero
};

// Exit family. Exactly one is active for the whole portfolio.
enum class ExitType {
  Timed,                // close the oldest unit after a fixed number of ticks
  Breakout,             // close all units on a prior N-tick low/high breach
  MacdSignalCrossover,  // close all units when MACD crosses Signal against us
};

// What to do when a direction is already entered and a new opportunity
// shows up.
enum class ExtraUnitPolicy {
  AsNewUnit,  // same trigger as a fresh entry
  UsingAtr,   // pyramid on an ATR-distance move since the latest unit
  No,         // never add
};

// Why a Unit was closed. Recorded in the ledger row.
enum class ExitKind {
  Exit,     // exit policy
  StopOut,  // stop-loss hit
  ExitAll,  // forced close after the last tick
};

const char* entryTypeToString(EntryType t);
const char* exitTypeToString(ExitType t);
const char* extraUnitPolicyToString(ExtraUnitPolicy p);
const char* exitKindToString(ExitKind k);

EntryType parseEntryType(const std::string& name);
ExitType parseExitType(const std::string& name);
ExtraUnitPolicy parseExtraUnitPolicy(const std::string& name);

}  // namespace domain
}  // namespace trendsim
