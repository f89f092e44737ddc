#include "trendsim/config/config_loader.hpp"

#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace trendsim {

namespace {

// Reads `key` into `out` when present. Type mismatches name the key.
template <typename T>
void readOptional(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it == j.end()) {
    return;
  }
  try {
    out = it->template get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string("config key \"") + key +
                                "\": " + e.what());
  }
}

// Same, for fields that stay unset when the key is absent or null.
template <typename T>
void readOptional(const nlohmann::json& j, const char* key,
                  std::optional<T>& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return;
  }
  try {
    out = it->template get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string("config key \"") + key +
                                "\": " + e.what());
  }
}

domain::SecurityOverrides parseSecurity(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("config \"securities\" entries must be objects");
  }
  domain::SecurityOverrides s;
  readOptional(j, "name", s.name);
  if (s.name.empty()) {
    throw std::invalid_argument("config \"securities\" entry without a name");
  }
  readOptional(j, "lot_size", s.lot_size);
  readOptional(j, "max_units", s.max_units);
  readOptional(j, "atr_average_range", s.atr_average_range);
  readOptional(j, "stop_loss_factor", s.stop_loss_factor);
  readOptional(j, "transaction_cost_rate", s.transaction_cost_rate);
  readOptional(j, "slippage_per_contract", s.slippage_per_contract);
  readOptional(j, "margin_factor", s.margin_factor);
  return s;
}

}  // namespace

// -----------------------------------------------------------------------------
// parseConfig()
// -----------------------------------------------------------------------------
LoadedConfig parseConfig(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw std::invalid_argument("configuration must be a JSON object");
  }

  LoadedConfig loaded;
  domain::PortfolioConfig& c = loaded.portfolio;

  // --- Policy names ---------------------------------------------------------
  std::string name;
  if (document.contains("entry_type")) {
    readOptional(document, "entry_type", name);
    c.entry_type = domain::parseEntryType(name);
  }
  if (document.contains("exit_type")) {
    readOptional(document, "exit_type", name);
    c.exit_type = domain::parseExitType(name);
  }
  if (document.contains("add_extra_units")) {
    readOptional(document, "add_extra_units", name);
    c.extra_units = domain::parseExtraUnitPolicy(name);
  }

  // --- Entry ----------------------------------------------------------------
  readOptional(document, "long_breakout", c.long_breakout);
  readOptional(document, "short_breakout", c.short_breakout);
  readOptional(document, "long_at_high", c.long_at_high);
  readOptional(document, "use_macd_signal_condition",
               c.use_macd_signal_condition);
  readOptional(document, "use_polarity_condition", c.use_polarity_condition);

  auto macd = document.find("macd");
  if (macd != document.end()) {
    if (!macd->is_object()) {
      throw std::invalid_argument("config key \"macd\" must be an object");
    }
    readOptional(*macd, "fast", c.macd.fast_length);
    readOptional(*macd, "slow", c.macd.slow_length);
    readOptional(*macd, "signal", c.macd.signal_length);
    readOptional(*macd, "smoothing", c.macd.smoothing);
  }

  // --- Additional units and stops -------------------------------------------
  readOptional(document, "extra_unit_atr_factor", c.extra_unit_atr_factor);
  readOptional(document, "adjust_stops_on_more_units",
               c.adjust_stops_on_more_units);
  readOptional(document, "adjust_stop_atr_factor", c.adjust_stop_atr_factor);
  readOptional(document, "use_stops", c.use_stops);
  readOptional(document, "stop_loss_factor", c.stop_loss_factor);

  // --- Exit -----------------------------------------------------------------
  readOptional(document, "exit_long_horizon", c.exit_long_horizon);
  readOptional(document, "exit_short_horizon", c.exit_short_horizon);
  readOptional(document, "exit_long_breakout", c.exit_long_breakout);
  readOptional(document, "exit_short_breakout", c.exit_short_breakout);

  // --- Account and security defaults ----------------------------------------
  readOptional(document, "notional_account_size", c.notional_account_size);
  readOptional(document, "compound_account_size", c.compound_account_size);
  readOptional(document, "risk_percent_of_account",
               c.risk_percent_of_account);
  readOptional(document, "max_position_limit_each_way",
               c.max_position_limit_each_way);
  readOptional(document, "max_margin_per_trade", c.max_margin_per_trade);
  readOptional(document, "margin_factor", c.margin_factor);
  readOptional(document, "atr_average_range", c.atr_average_range);
  readOptional(document, "max_units", c.max_units);
  readOptional(document, "lot_size", c.lot_size);
  readOptional(document, "transaction_cost_rate", c.transaction_cost_rate);
  readOptional(document, "slippage_per_contract", c.slippage_per_contract);
  readOptional(document, "log_trades", c.log_trades);

  c.validate();

  auto securities = document.find("securities");
  if (securities != document.end()) {
    if (!securities->is_array()) {
      throw std::invalid_argument("config key \"securities\" must be an array");
    }
    for (const auto& entry : *securities) {
      domain::SecurityOverrides overrides = parseSecurity(entry);
      // Surfaces bad overrides here rather than at addSecurity().
      domain::resolveSecurityConfig(c, overrides);
      loaded.securities.push_back(std::move(overrides));
    }
  }

  return loaded;
}

// -----------------------------------------------------------------------------
// loadConfig()
// -----------------------------------------------------------------------------
LoadedConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::invalid_argument("cannot open config file \"" + path + "\"");
  }

  nlohmann::json document;
  try {
    in >> document;
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument("config file \"" + path +
                                "\": " + e.what());
  }

  try {
    return parseConfig(document);
  } catch (const std::invalid_argument& e) {
    throw std::invalid_argument("config file \"" + path + "\": " + e.what());
  }
}

}  // namespace trendsim
