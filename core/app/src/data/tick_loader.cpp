#include "trendsim/data/tick_loader.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>
#include <tuple>
#include <unordered_map>
#include <utility>

namespace trendsim {

// -----------------------------------------------------------------------------
// readTickMessages(): one JSON message per line
// -----------------------------------------------------------------------------
std::vector<SymbolSeries> readTickMessages(std::istream& in,
                                           const std::string& source) {
  std::vector<SymbolSeries> symbols;
  std::unordered_map<std::string, std::size_t> index_of;

  std::string line;
  std::size_t line_no = 0;
  std::size_t skipped = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }

    try {
      auto json = nlohmann::json::parse(line);

      std::int64_t timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();
      std::string symbol = json.at("symbol").get<std::string>();
      double price = std::fabs(json.at("price").get<double>());

      if (!std::isfinite(price) || price == 0.0) {
        std::cerr << "[TickLoader] WARNING: " << source << ":" << line_no
                  << ": unusable price for " << symbol << ", skipped\n";
        ++skipped;
        continue;
      }

      auto [it, inserted] = index_of.emplace(symbol, symbols.size());
      if (inserted) {
        symbols.push_back(SymbolSeries{symbol, {}});
      }
      symbols[it->second].series.push_back(
          domain::PricePoint{ms_to_timestamp(timestamp_ms), price});

    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[TickLoader] WARNING: " << source << ":" << line_no
                << ": " << e.what() << ", skipped\n";
      ++skipped;
    }
  }

  // Time order per symbol. The first message for a timestamp wins.
  for (auto& s : symbols) {
    std::stable_sort(s.series.begin(), s.series.end(),
                     [](const domain::PricePoint& a,
                        const domain::PricePoint& b) { return a.time < b.time; });
    auto dup = std::unique(
        s.series.begin(), s.series.end(),
        [](const domain::PricePoint& a, const domain::PricePoint& b) {
          return a.time == b.time;
        });
    const auto dropped = std::distance(dup, s.series.end());
    if (dropped > 0) {
      std::cerr << "[TickLoader] WARNING: " << source << ": " << dropped
                << " duplicate timestamps for " << s.symbol << ", skipped\n";
      skipped += static_cast<std::size_t>(dropped);
      s.series.erase(dup, s.series.end());
    }
  }

  std::cout << "[TickLoader] " << source << ": " << symbols.size()
            << " symbols, " << line_no << " lines, " << skipped
            << " skipped\n";
  return symbols;
}

// -----------------------------------------------------------------------------
// retainLongestContiguousRun()
// -----------------------------------------------------------------------------
std::pair<std::size_t, std::size_t> retainLongestContiguousRun(
    const std::vector<Timestamp>& times, std::int64_t interval_ms) {
  if (times.empty()) {
    return {0, 0};
  }

  std::size_t best_first = 0;
  std::size_t best_len = 1;
  std::size_t run_first = 0;
  for (std::size_t i = 1; i < times.size(); ++i) {
    const auto step = timestamp_to_ms(times[i]) - timestamp_to_ms(times[i - 1]);
    if (step != interval_ms) {
      run_first = i;
    }
    const std::size_t run_len = i - run_first + 1;
    if (run_len > best_len) {
      best_first = run_first;
      best_len = run_len;
    }
  }
  return {best_first, best_first + best_len};
}

// -----------------------------------------------------------------------------
// alignSeries(): inner join, contiguous run, warm-up split
// -----------------------------------------------------------------------------
domain::MarketData alignSeries(const std::vector<SymbolSeries>& symbols,
                               const AlignOptions& options) {
  domain::MarketData data;
  if (symbols.empty()) {
    return data;
  }

  // Timestamps present in every symbol, with each symbol's price.
  std::map<Timestamp, std::vector<double>> joined;
  for (const auto& point : symbols.front().series) {
    joined[point.time].push_back(point.price);
  }
  for (std::size_t s = 1; s < symbols.size(); ++s) {
    std::map<Timestamp, double> prices;
    for (const auto& point : symbols[s].series) {
      prices.emplace(point.time, point.price);
    }
    for (auto it = joined.begin(); it != joined.end();) {
      auto match = prices.find(it->first);
      if (match == prices.end()) {
        it = joined.erase(it);
      } else {
        it->second.push_back(match->second);
        ++it;
      }
    }
  }

  std::vector<Timestamp> times;
  times.reserve(joined.size());
  for (const auto& [time, row] : joined) {
    times.push_back(time);
  }

  std::size_t first = 0;
  std::size_t last = times.size();
  if (options.contiguous_interval_ms) {
    std::tie(first, last) =
        retainLongestContiguousRun(times, *options.contiguous_interval_ms);
  }

  for (const auto& s : symbols) {
    data.names.push_back(s.symbol);
  }
  data.warmup.resize(symbols.size());

  std::size_t row_index = 0;
  for (const auto& [time, row] : joined) {
    if (row_index >= first && row_index < last) {
      const std::size_t offset = row_index - first;
      if (offset < options.warmup_length) {
        for (std::size_t s = 0; s < row.size(); ++s) {
          data.warmup[s].push_back(domain::PricePoint{time, row[s]});
        }
      } else {
        data.ticks.push_back(domain::Tick{time, row});
      }
    }
    ++row_index;
  }

  return data;
}

// -----------------------------------------------------------------------------
// loadMarketData()
// -----------------------------------------------------------------------------
domain::MarketData loadMarketData(const std::string& path,
                                  const AlignOptions& options) {
  std::ifstream in(path);
  if (!in) {
    throw std::invalid_argument("cannot open tick file \"" + path + "\"");
  }

  domain::MarketData data = alignSeries(readTickMessages(in, path), options);
  if (data.names.empty()) {
    throw std::invalid_argument("tick file \"" + path +
                                "\" contains no usable messages");
  }
  if (data.ticks.empty()) {
    throw std::invalid_argument(
        "tick file \"" + path + "\": " +
        std::to_string(data.warmup.front().size()) +
        " aligned rows, need more than the warm-up length " +
        std::to_string(options.warmup_length));
  }

  std::cout << "[TickLoader] " << path << ": " << data.names.size()
            << " securities, " << data.warmup.front().size()
            << " warm-up rows, " << data.ticks.size() << " ticks\n";
  return data;
}

}  // namespace trendsim
