#pragma once

#include "trendsim/ledger/ledger_row.hpp"
#include "trendsim/ledger/trade_book.hpp"

#include <zmq.hpp>

#include <cstddef>
#include <string>

namespace trendsim {

// -----------------------------------------------------------------------------
// TelemetryPublisher: ZeroMQ PUB socket broadcasting run telemetry
// -----------------------------------------------------------------------------
//
// @brief  Publishes JSON messages about a running simulation to external
//         subscribers (dashboards, notebooks).
//
// @details
// Message types (one JSON object per ZMQ message, "type" field first):
//
//   {"type": "progress", "fraction": 0.42}
//   {"type": "trade_closed", "trade": { ledger row }}
//   {"type": "summary", "stats": { statistics }}
//
// Sends use zmq::send_flags::dontwait. With no subscriber connected a PUB
// socket drops messages anyway; a send that would block or fails is logged
// and dropped. Telemetry never stops the simulation.
//
// Thread model:
//   Single-threaded. Called from the Portfolio's sinks on the simulation
//   thread, so no queue or worker thread is needed.
//
// Ownership:
//   Owns the ZMQ context and the PUB socket (RAII, closed on destruction).
// -----------------------------------------------------------------------------
class TelemetryPublisher {
 public:
  // Binds the PUB socket. Throws zmq::error_t if the endpoint is invalid or
  // already in use.
  explicit TelemetryPublisher(const std::string& endpoint);

  TelemetryPublisher(const TelemetryPublisher&) = delete;
  TelemetryPublisher& operator=(const TelemetryPublisher&) = delete;

  void publishProgress(double fraction);
  void publishTradeClosed(const LedgerRow& row);
  void publishSummary(const SimulationStats& stats);

  const std::string& endpoint() const { return endpoint_; }
  std::size_t sentCount() const { return sent_; }
  std::size_t droppedCount() const { return dropped_; }

 private:
  void send(const std::string& payload);

  std::string endpoint_;
  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::pub};

  std::size_t sent_{0};
  std::size_t dropped_{0};
};

}  // namespace trendsim
