#pragma once

#include "trendsim/domain/config.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace trendsim {

// -----------------------------------------------------------------------------
// LoadedConfig: result of parsing a configuration document
// -----------------------------------------------------------------------------
struct LoadedConfig {
  domain::PortfolioConfig portfolio;
  std::vector<domain::SecurityOverrides> securities;  // file order
};

// -----------------------------------------------------------------------------
// Configuration loading
// -----------------------------------------------------------------------------
//
// @brief  Builds a PortfolioConfig (and per-security overrides) from JSON.
//
// @details
// Every key is optional; a missing key keeps the PortfolioConfig default.
// Policy names ("entry_type", "exit_type", "add_extra_units") go through the
// domain parse*() functions, so an unknown name is rejected. The result is
// validated before it is returned.
//
// Error reporting:
//   All failures surface as std::invalid_argument. nlohmann's type and parse
//   errors are wrapped with the offending key (and, for loadConfig(), the
//   file name).
// -----------------------------------------------------------------------------
LoadedConfig parseConfig(const nlohmann::json& document);

// Reads and parses `path`. Throws std::invalid_argument when the file
// cannot be opened or does not hold a valid configuration.
LoadedConfig loadConfig(const std::string& path);

}  // namespace trendsim
