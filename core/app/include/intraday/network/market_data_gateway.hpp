#pragma once

#include "intraday/logging/logger.hpp"
#include "intraday/market/i_quote_source.hpp"
#include "intraday/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <string>

namespace intraday {

// -----------------------------------------------------------------------------
// MarketDataGateway — ZeroMQ subscriber for quote ticks
// -----------------------------------------------------------------------------
//
// @brief  Listens on a SUB socket for JSON-encoded ticks and hands each
//         decoded quote to a sink (normally QuoteBook::update).
//
// @details
// Expected JSON format from the feed publisher:
//   {
//     "timestamp_ms": 1733900000000,         // int64 epoch milliseconds
//     "symbol":       "NSE:NIFTY24DECFUT",
//     "ltp":          24150.5,               // last traded price
//     "bid":          24150.0,               // optional, 0 when absent
//     "ask":          24151.0                // optional, 0 when absent
//   }
//
// On each message, IN ORDER:
//   1. If a replay clock was given, advance_time(timestamp_ms) so anything
//      reading now_ms() while this tick is processed sees the tick's time.
//   2. quote_sink_(symbol, quote).
// Malformed payloads (bad JSON, missing or mistyped fields) are logged as
// warnings and skipped.
//
// Thread model:
//   run() blocks; call it from a dedicated thread (MarketDataThread).
//   stop() may be called from any thread; the loop notices within
//   kRecvTimeoutMs because the socket has ZMQ_RCVTIMEO set.
//   handleMessage() runs on whichever thread calls it (the recv thread in
//   production, the test thread in unit tests).
//
// Ownership:
//   Owns the ZMQ context and socket. Holds references to the logger and
//   (optionally) the replay clock; both must outlive the gateway.
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  using QuoteSink = std::function<void(const std::string&, const Quote&)>;

  // @param  replay_clock  nullptr in wall-clock mode; otherwise advanced to
  //                       every tick's timestamp before the sink is called.
  MarketDataGateway(QuoteSink quote_sink, Logger& logger,
                    SimulationTimeProvider* replay_clock,
                    const std::string& endpoint = "tcp://127.0.0.1:5555");

  ~MarketDataGateway() = default;

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;
  MarketDataGateway(MarketDataGateway&&) = delete;
  MarketDataGateway& operator=(MarketDataGateway&&) = delete;

  void run();
  void stop();

  // Decodes one payload and applies it. Returns false if it was skipped.
  bool handleMessage(const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  QuoteSink quote_sink_;
  Logger& logger_;
  SimulationTimeProvider* replay_clock_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
};

}  // namespace intraday
