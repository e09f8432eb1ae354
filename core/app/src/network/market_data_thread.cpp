#include "intraday/network/market_data_thread.hpp"

#include <zmq.hpp>

#include <string>
#include <utility>

namespace intraday {

MarketDataThread::MarketDataThread(QuoteSink quote_sink, Logger& logger,
                                   SimulationTimeProvider* replay_clock,
                                   std::string endpoint)
    : quote_sink_(std::move(quote_sink)),
      logger_(logger),
      replay_clock_(replay_clock),
      endpoint_(std::move(endpoint)) {}

MarketDataThread::~MarketDataThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): create gateway and spawn recv thread
// -----------------------------------------------------------------------------
void MarketDataThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<MarketDataGateway>(quote_sink_, logger_,
                                                 replay_clock_, endpoint_);

  // A socket failure ends the feed, not the process: the session keeps
  // serving commands against the last quotes it has.
  thread_ = std::thread([this] {
    logger_.info("[MarketDataThread] listening on " + endpoint_);
    try {
      gateway_->run();
      logger_.info("[MarketDataThread] recv loop exited.");
    } catch (const zmq::error_t& e) {
      logger_.error(std::string("[MarketDataThread] feed stopped: ") +
                    e.what());
    }
  });
}

// -----------------------------------------------------------------------------
// stop(): signal gateway and join thread
// -----------------------------------------------------------------------------
void MarketDataThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  gateway_.reset();
}

}  // namespace intraday
