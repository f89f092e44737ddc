#include "trendsim/domain/policy.hpp"

#include <stdexcept>

namespace trendsim {
namespace domain {

const char* entryTypeToString(EntryType t) {
  switch (t) {
    case EntryType::Breakout:            return "Breakout";
    case EntryType::MacdSignalCrossover: return "MACD signal crossover";
    case EntryType::MacdZeroCrossover:   return "MACD zero crossover";
  }
  return "Unknown";
}

const char* exitTypeToString(ExitType t) {
  switch (t) {
    case ExitType::Timed:               return "Timed";
    case ExitType::Breakout:            return "Breakout";
    case ExitType::MacdSignalCrossover: return "MACD signal crossover";
  }
  return "Unknown";
}

const char* extraUnitPolicyToString(ExtraUnitPolicy p) {
  switch (p) {
    case ExtraUnitPolicy::AsNewUnit: return "As new unit";
    case ExtraUnitPolicy::UsingAtr:  return "Using ATR";
    case ExtraUnitPolicy::No:        return "No";
  }
  return "Unknown";
}

const char* exitKindToString(ExitKind k) {
  switch (k) {
    case ExitKind::Exit:    return "Exit";
    case ExitKind::StopOut: return "Stop out";
    case ExitKind::ExitAll: return "Exit all";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// parse*: configuration names -> enum, throwing on anything unrecognised
// -----------------------------------------------------------------------------
EntryType parseEntryType(const std::string& name) {
  if (name == "Breakout") {
    return EntryType::Breakout;
  }
  if (name == "MACD signal crossover") {
    return EntryType::MacdSignalCrossover;
  }
  if (name == "MACD zero crossover") {
    return EntryType::MacdZeroCrossover;
  }
  throw std::invalid_argument("Unrecognized entry type: \"" + name + "\"");
}

ExitType parseExitType(const std::string& name) {
  if (name == "Timed") {
    return ExitType::Timed;
  }
  if (name == "Breakout") {
    return ExitType::Breakout;
  }
  if (name == "MACD signal crossover") {
    return ExitType::MacdSignalCrossover;
  }
  throw std::invalid_argument("Unrecognized exit type: \"" + name + "\"");
}

ExtraUnitPolicy parseExtraUnitPolicy(const std::string& name) {
  if (name == "As new unit") {
    return ExtraUnitPolicy::AsNewUnit;
  }
  if (name == "Using ATR") {
    return ExtraUnitPolicy::UsingAtr;
  }
  if (name == "No") {
    return ExtraUnitPolicy::No;
  }
  throw std::invalid_argument("Unrecognized additional-unit policy: \"" +
                              name + "\"");
}

}  // namespace domain
}  // namespace trendsim
