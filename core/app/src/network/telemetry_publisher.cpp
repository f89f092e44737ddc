#include "trendsim/network/telemetry_publisher.hpp"
#include "trendsim/ledger/ledger_json.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace trendsim {

// -----------------------------------------------------------------------------
// Constructor: bind the PUB socket
// -----------------------------------------------------------------------------
TelemetryPublisher::TelemetryPublisher(const std::string& endpoint)
    : endpoint_(endpoint) {
  // Pending messages are discarded on close instead of blocking shutdown.
  socket_.set(zmq::sockopt::linger, 0);
  socket_.bind(endpoint_);
  std::cout << "[Telemetry] publishing on " << endpoint_ << "\n";
}

void TelemetryPublisher::publishProgress(double fraction) {
  nlohmann::json j;
  j["type"] = "progress";
  j["fraction"] = fraction;
  send(j.dump());
}

void TelemetryPublisher::publishTradeClosed(const LedgerRow& row) {
  nlohmann::json j;
  j["type"] = "trade_closed";
  j["trade"] = toJson(row);
  send(j.dump());
}

void TelemetryPublisher::publishSummary(const SimulationStats& stats) {
  nlohmann::json j;
  j["type"] = "summary";
  j["stats"] = toJson(stats);
  send(j.dump());
}

// -----------------------------------------------------------------------------
// send(): non-blocking, failures are logged and dropped
// -----------------------------------------------------------------------------
void TelemetryPublisher::send(const std::string& payload) {
  zmq::message_t msg(payload.data(), payload.size());
  try {
    auto result = socket_.send(msg, zmq::send_flags::dontwait);
    if (!result.has_value()) {
      ++dropped_;
      std::cerr << "[Telemetry] WARNING: send would block, message dropped\n";
      return;
    }
    ++sent_;
  } catch (const zmq::error_t& e) {
    ++dropped_;
    std::cerr << "[Telemetry] WARNING: send failed: " << e.what() << "\n";
  }
}

}  // namespace trendsim
