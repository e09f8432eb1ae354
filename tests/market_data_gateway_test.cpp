// =============================================================================
// market_data_gateway_test.cpp
// =============================================================================
// Unit tests for intraday::MarketDataGateway and MarketDataThread.
//
// Validates:
//   - Tick JSON decoding (bid/ask optional)
//   - Replay clock advanced to the tick's timestamp; untouched in wall mode
//   - Malformed ticks are logged and skipped
//   - End to end: a PUB socket feeding MarketDataThread into a QuoteBook
// =============================================================================

#include "intraday/logging/logger.hpp"
#include "intraday/market/quote_book.hpp"
#include "intraday/network/market_data_gateway.hpp"
#include "intraday/network/market_data_thread.hpp"
#include "intraday/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <zmq.hpp>

#include <chrono>
#include <string>
#include <thread>

namespace {

// Nothing listens here; connect() on a SUB socket does not need a peer.
constexpr const char* kUnusedEndpoint = "tcp://127.0.0.1:55729";

}  // namespace

class MarketDataGatewayTest : public ::testing::Test {
 protected:
  intraday::SimulationTimeProvider clock{0};
  intraday::Logger logger{clock, "", 1000, false};
  intraday::QuoteBook book;

  intraday::MarketDataGateway::QuoteSink sink() {
    return [this](const std::string& symbol, const intraday::Quote& q) {
      book.update(symbol, q);
    };
  }
};

// -----------------------------------------------------------------------------
// 1. Full tick: quote stored, replay clock advanced first.
// -----------------------------------------------------------------------------
TEST_F(MarketDataGatewayTest, DecodesTickAndAdvancesReplayClock) {
  std::int64_t clock_seen_by_sink = -1;
  intraday::MarketDataGateway gateway(
      [this, &clock_seen_by_sink](const std::string& symbol,
                                  const intraday::Quote& q) {
        clock_seen_by_sink = clock.now_ms();
        book.update(symbol, q);
      },
      logger, &clock, kUnusedEndpoint);

  EXPECT_TRUE(gateway.handleMessage(
      R"({"timestamp_ms": 1733900000000, "symbol": "NSE:NIFTY24DECFUT",
          "ltp": 24150.5, "bid": 24150.0, "ask": 24151.0})"));

  EXPECT_EQ(clock.now_ms(), 1'733'900'000'000);
  EXPECT_EQ(clock_seen_by_sink, 1'733'900'000'000);

  auto q = book.latestQuote("NSE:NIFTY24DECFUT");
  ASSERT_TRUE(q.has_value());
  EXPECT_DOUBLE_EQ(q->ltp, 24150.5);
  EXPECT_DOUBLE_EQ(q->bid, 24150.0);
  EXPECT_DOUBLE_EQ(q->ask, 24151.0);
  EXPECT_EQ(intraday::timestamp_to_ms(q->timestamp), 1'733'900'000'000);
}

// -----------------------------------------------------------------------------
// 2. Wall-clock mode: no clock given, bid/ask default to 0.
// -----------------------------------------------------------------------------
TEST_F(MarketDataGatewayTest, WallModeLeavesClockAlone) {
  intraday::MarketDataGateway gateway(sink(), logger, nullptr, kUnusedEndpoint);

  EXPECT_TRUE(gateway.handleMessage(
      R"({"timestamp_ms": 5000, "symbol": "NSE:SBIN-EQ", "ltp": 801.25})"));

  EXPECT_EQ(clock.now_ms(), 0);
  auto q = book.latestQuote("NSE:SBIN-EQ");
  ASSERT_TRUE(q.has_value());
  EXPECT_EQ(q->bid, 0.0);
  EXPECT_EQ(q->ask, 0.0);
}

// -----------------------------------------------------------------------------
// 3. Malformed ticks: skipped with a warning, nothing stored.
// -----------------------------------------------------------------------------
TEST_F(MarketDataGatewayTest, MalformedTicksAreSkipped) {
  intraday::MarketDataGateway gateway(sink(), logger, &clock, kUnusedEndpoint);

  EXPECT_FALSE(gateway.handleMessage("not json"));
  EXPECT_FALSE(gateway.handleMessage(R"({"symbol": "X", "ltp": 1.0})"));
  EXPECT_FALSE(gateway.handleMessage(
      R"({"timestamp_ms": 1, "symbol": "X", "ltp": "high"})"));
  EXPECT_FALSE(gateway.handleMessage(
      R"({"timestamp_ms": 1, "symbol": "", "ltp": 1.0})"));

  EXPECT_FALSE(book.latestQuote("X").has_value());
  EXPECT_EQ(clock.now_ms(), 0);

  auto entries = logger.entries();
  ASSERT_EQ(entries.size(), 4u);
  for (const auto& e : entries) {
    EXPECT_EQ(e.level, intraday::LogLevel::Warn);
  }
}

// -----------------------------------------------------------------------------
// 4. End to end over TCP. PUB/SUB drops messages until the subscription has
//    propagated, so the publisher repeats until the quote shows up.
// -----------------------------------------------------------------------------
TEST_F(MarketDataGatewayTest, ThreadFeedsQuoteBookOverZmq) {
  const std::string endpoint = "tcp://127.0.0.1:55731";

  zmq::context_t ctx{1};
  zmq::socket_t pub{ctx, zmq::socket_type::pub};
  pub.set(zmq::sockopt::linger, 0);
  pub.bind(endpoint);

  intraday::MarketDataThread feed(sink(), logger, &clock, endpoint);
  feed.start();

  const std::string tick =
      R"({"timestamp_ms": 1733900001000, "symbol": "NSE:RELIANCE-EQ", "ltp": 1290.4})";
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!book.latestQuote("NSE:RELIANCE-EQ") &&
         std::chrono::steady_clock::now() < deadline) {
    pub.send(zmq::buffer(tick), zmq::send_flags::dontwait);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  feed.stop();
  feed.stop();  // Idempotent.

  auto q = book.latestQuote("NSE:RELIANCE-EQ");
  ASSERT_TRUE(q.has_value());
  EXPECT_DOUBLE_EQ(q->ltp, 1290.4);
  EXPECT_EQ(clock.now_ms(), 1'733'900'001'000);
}
