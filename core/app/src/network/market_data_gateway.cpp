#include "intraday/network/market_data_gateway.hpp"
#include "intraday/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <utility>

namespace intraday {

// -----------------------------------------------------------------------------
// Constructor: SUB socket, subscribe to everything, receive timeout
// -----------------------------------------------------------------------------
MarketDataGateway::MarketDataGateway(QuoteSink quote_sink, Logger& logger,
                                     SimulationTimeProvider* replay_clock,
                                     const std::string& endpoint)
    : quote_sink_(std::move(quote_sink)),
      logger_(logger),
      replay_clock_(replay_clock) {
  socket_.set(zmq::sockopt::subscribe, "");
  // Without a receive timeout recv() never returns and stop() hangs.
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void MarketDataGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;

    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }

    if (!result.has_value()) {
      continue;
    }

    handleMessage(msg.to_string());
  }
}

// -----------------------------------------------------------------------------
// handleMessage(): decode, advance replay clock, store quote
// -----------------------------------------------------------------------------
bool MarketDataGateway::handleMessage(const std::string& payload) {
  std::string symbol;
  std::int64_t timestamp_ms = 0;
  Quote quote;

  try {
    auto json = nlohmann::json::parse(payload);

    timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();
    symbol = json.at("symbol").get<std::string>();
    quote.ltp = json.at("ltp").get<double>();
    quote.bid = json.value("bid", 0.0);
    quote.ask = json.value("ask", 0.0);
  } catch (const nlohmann::json::exception& e) {
    logger_.warn(std::string("[MarketDataGateway] JSON parse error: ") +
                 e.what() + " payload: " + payload);
    return false;
  }

  if (symbol.empty()) {
    logger_.warn("[MarketDataGateway] Tick without symbol skipped: " +
                 payload);
    return false;
  }

  if (replay_clock_ != nullptr) {
    replay_clock_->advance_time(timestamp_ms);
  }

  quote.timestamp = ms_to_timestamp(timestamp_ms);
  quote_sink_(symbol, quote);
  return true;
}

void MarketDataGateway::stop() { running_.store(false); }

}  // namespace intraday
