#pragma once

#include "intraday/logging/logger.hpp"
#include "intraday/network/market_data_gateway.hpp"
#include "intraday/time/simulation_time_provider.hpp"

#include <memory>
#include <string>
#include <thread>

namespace intraday {

// -----------------------------------------------------------------------------
// MarketDataThread — dedicated I/O thread for quote ingestion
// -----------------------------------------------------------------------------
//
// @brief  Owns a MarketDataGateway and the std::thread running its recv
//         loop, so TradingSession can start and stop the feed as one unit.
//
// @details
// The gateway is created in start(), not in the constructor, so no socket is
// opened until the session is actually started.
//
// Thread model:
//   start()/stop() are called from the owning thread (main). The internal
//   thread runs MarketDataGateway::run() exclusively.
//
// Ownership:
//   Owned by TradingSession via std::unique_ptr. Owns the gateway.
// -----------------------------------------------------------------------------
class MarketDataThread {
 public:
  using QuoteSink = MarketDataGateway::QuoteSink;

  MarketDataThread(QuoteSink quote_sink, Logger& logger,
                   SimulationTimeProvider* replay_clock,
                   std::string endpoint = "tcp://127.0.0.1:5555");

  ~MarketDataThread();

  MarketDataThread(const MarketDataThread&) = delete;
  MarketDataThread& operator=(const MarketDataThread&) = delete;
  MarketDataThread(MarketDataThread&&) = delete;
  MarketDataThread& operator=(MarketDataThread&&) = delete;

  // Idempotent.
  void start();

  // Idempotent; blocks until the recv loop exits.
  void stop();

 private:
  QuoteSink quote_sink_;
  Logger& logger_;
  SimulationTimeProvider* replay_clock_;
  std::string endpoint_;

  std::unique_ptr<MarketDataGateway> gateway_;
  std::thread thread_;
};

}  // namespace intraday
