// -----------------------------------------------------------------------------
// trendsim: single executable entry point.
//
// Usage:
//   trendsim <config.json> <ticks.jsonl> [--ledger <report.json>]
//            [--telemetry <zmq endpoint>] [--no-contiguous]
//
// Backtest run:
//   1) Load the configuration (portfolio policy + per-security overrides).
//   2) Load the tick file, align the symbols on time and split off the
//      warm-up rows the configured indicators need.
//   3) Create the Portfolio and add one Security per symbol, in file order.
//   4) Optionally bind a TelemetryPublisher and hook it up as the progress
//      and trade sinks.
//   5) Run the simulation to the end, print the statistics and optionally
//      write the ledger report.
//
// Everything lives on the stack of main(); the run is single-threaded.
// -----------------------------------------------------------------------------

#include "trendsim/config/config_loader.hpp"
#include "trendsim/data/tick_loader.hpp"
#include "trendsim/engine/portfolio.hpp"
#include "trendsim/ledger/ledger_json.hpp"
#include "trendsim/network/telemetry_publisher.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct CliOptions {
  std::string config_path;
  std::string ticks_path;
  std::optional<std::string> ledger_path;
  std::optional<std::string> telemetry_endpoint;
  bool contiguous_only{true};
};

void printUsage(const char* argv0) {
  std::cerr << "usage: " << argv0
            << " <config.json> <ticks.jsonl> [--ledger <report.json>]"
               " [--telemetry <endpoint>] [--no-contiguous]\n";
}

CliOptions parseArgs(int argc, char** argv) {
  CliOptions opts;
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--ledger" || arg == "--telemetry") {
      if (i + 1 >= argc) {
        throw std::invalid_argument(arg + " needs a value");
      }
      (arg == "--ledger" ? opts.ledger_path : opts.telemetry_endpoint) =
          std::string(argv[++i]);
    } else if (arg == "--no-contiguous") {
      opts.contiguous_only = false;
    } else if (!arg.empty() && arg[0] == '-') {
      throw std::invalid_argument("unknown option " + arg);
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.size() != 2) {
    throw std::invalid_argument("expected <config.json> and <ticks.jsonl>");
  }
  opts.config_path = positional[0];
  opts.ticks_path = positional[1];
  return opts;
}

// Overrides from the config for `name`, or plain portfolio defaults.
trendsim::domain::SecurityOverrides overridesFor(
    const std::vector<trendsim::domain::SecurityOverrides>& configured,
    const std::string& name) {
  for (const auto& o : configured) {
    if (o.name == name) {
      return o;
    }
  }
  trendsim::domain::SecurityOverrides defaults;
  defaults.name = name;
  return defaults;
}

int runBacktest(const CliOptions& opts) {
  // ---  1) Configuration -----------------------------------------------------
  trendsim::LoadedConfig loaded = trendsim::loadConfig(opts.config_path);

  // ---  2) Market data -------------------------------------------------------
  trendsim::AlignOptions align;
  align.warmup_length = loaded.portfolio.minWarmupLength();
  if (!opts.contiguous_only) {
    align.contiguous_interval_ms.reset();
  }
  trendsim::domain::MarketData data =
      trendsim::loadMarketData(opts.ticks_path, align);

  for (const auto& o : loaded.securities) {
    bool found = false;
    for (const auto& name : data.names) {
      found = found || name == o.name;
    }
    if (!found) {
      std::cerr << "[main] WARNING: configured security \"" << o.name
                << "\" has no data in " << opts.ticks_path << "\n";
    }
  }

  // ---  3) Portfolio ---------------------------------------------------------
  trendsim::Portfolio portfolio(loaded.portfolio);
  for (std::size_t i = 0; i < data.names.size(); ++i) {
    portfolio.addSecurity(overridesFor(loaded.securities, data.names[i]),
                          std::move(data.warmup[i]));
  }

  // ---  4) Telemetry ---------------------------------------------------------
  std::unique_ptr<trendsim::TelemetryPublisher> telemetry;
  trendsim::ProgressSink progress;
  if (opts.telemetry_endpoint) {
    telemetry =
        std::make_unique<trendsim::TelemetryPublisher>(*opts.telemetry_endpoint);
    progress = [&telemetry](double fraction) {
      telemetry->publishProgress(fraction);
    };
    portfolio.setTradeClosedSink([&telemetry](const trendsim::LedgerRow& row) {
      telemetry->publishTradeClosed(row);
    });
  }

  // ---  5) Run ---------------------------------------------------------------
  const trendsim::SimulationStats& stats = portfolio.run(data.ticks, progress);
  if (telemetry) {
    telemetry->publishSummary(stats);
  }

  std::cout << trendsim::toJson(stats).dump(2) << "\n";

  if (opts.ledger_path) {
    std::ofstream out(*opts.ledger_path);
    if (!out) {
      throw std::runtime_error("cannot write ledger report \"" +
                               *opts.ledger_path + "\"");
    }
    out << trendsim::ledgerReport(portfolio.tradeBook(), stats).dump(2)
        << "\n";
    std::cout << "[main] ledger written to " << *opts.ledger_path << " ("
              << portfolio.tradeBook().size() << " trades)\n";
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  CliOptions opts;
  try {
    opts = parseArgs(argc, argv);
  } catch (const std::invalid_argument& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    printUsage(argv[0]);
    return 2;
  }

  try {
    return runBacktest(opts);
  } catch (const std::exception& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  }
}
