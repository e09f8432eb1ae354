// =============================================================================
// paper_trader_test.cpp
// =============================================================================
// Unit tests for intraday::PaperTrader.
//
// Validates:
//   - BUY fills at ask, SELL at bid, each falling back to ltp
//   - Missing quote / no usable price → OrderError, ledger untouched
//   - lots <= 0 → std::invalid_argument
//   - Order ids PAPER000001, PAPER000002, ... and "Paper Executed" status
//   - Fills reach the PositionManager (position and closed trades)
//   - Minimum interval between orders is enforced
//   - updateInstrument() switches symbol and lot size
// =============================================================================

#include "intraday/execution/paper_trader.hpp"
#include "intraday/ledger/position_manager.hpp"
#include "intraday/logging/logger.hpp"
#include "intraday/market/quote_book.hpp"
#include "intraday/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

using intraday::domain::Side;

namespace {

intraday::domain::Instrument nifty() {
  intraday::domain::Instrument inst;
  inst.symbol = "NSE:NIFTY24DECFUT";
  inst.exchange = "NSE";
  inst.lot_size = 25;
  return inst;
}

}  // namespace

class PaperTraderTest : public ::testing::Test {
 protected:
  void setQuote(const std::string& symbol, double ltp, double bid, double ask) {
    intraday::Quote q;
    q.ltp = ltp;
    q.bid = bid;
    q.ask = ask;
    q.timestamp = intraday::ms_to_timestamp(clock.now_ms());
    quotes.update(symbol, q);
  }

  intraday::SimulationTimeProvider clock{1'733'900'000'000};
  intraday::Logger logger{clock, "", 1000, false};
  intraday::PositionManager pm{clock, logger, /*simulation_mode=*/true};
  intraday::QuoteBook quotes;
  intraday::PaperTrader trader{pm,      quotes, logger, clock, nifty(),
                               std::chrono::milliseconds{0}};
};

// -----------------------------------------------------------------------------
// 1. BUY at ask, SELL at bid; ids and status; trade reconstructed.
// -----------------------------------------------------------------------------
TEST_F(PaperTraderTest, BuyAtAskSellAtBid) {
  setQuote("NSE:NIFTY24DECFUT", 24150.0, 24149.0, 24151.0);

  auto buy = trader.placeOrder(Side::Buy, 2);
  ASSERT_TRUE(buy.has_value());
  EXPECT_DOUBLE_EQ(buy->price, 24151.0);
  EXPECT_EQ(buy->order_id, "PAPER000001");
  EXPECT_EQ(buy->status, "Paper Executed");
  EXPECT_EQ(buy->quantity, 2);
  EXPECT_EQ(buy->side, Side::Buy);

  setQuote("NSE:NIFTY24DECFUT", 24170.0, 24169.0, 24171.0);
  auto sell = trader.placeOrder(Side::Sell, 2);
  ASSERT_TRUE(sell.has_value());
  EXPECT_DOUBLE_EQ(sell->price, 24169.0);
  EXPECT_EQ(sell->order_id, "PAPER000002");

  auto orders = pm.snapshotOrders();
  ASSERT_EQ(orders.size(), 2u);
  EXPECT_EQ(orders[0].order_id, "PAPER000001");

  auto trades = pm.snapshotTrades();
  ASSERT_EQ(trades.size(), 1u);
  EXPECT_EQ(trades[0].qty, 50);
  EXPECT_DOUBLE_EQ(trades[0].pnl, (24169.0 - 24151.0) * 50);
  EXPECT_FALSE(pm.hasOpenPosition());
}

// -----------------------------------------------------------------------------
// 2. No depth on the chosen side → last traded price.
// -----------------------------------------------------------------------------
TEST_F(PaperTraderTest, FallsBackToLastTradedPrice) {
  setQuote("NSE:NIFTY24DECFUT", 24150.0, 0.0, 0.0);

  auto buy = trader.placeOrder(Side::Buy, 1);
  ASSERT_TRUE(buy.has_value());
  EXPECT_DOUBLE_EQ(buy->price, 24150.0);

  auto pos = pm.snapshotPosition();
  EXPECT_EQ(pos.qty_units, 25);
  EXPECT_DOUBLE_EQ(pos.avg_price, 24150.0);
}

// -----------------------------------------------------------------------------
// 3. No quote at all, or no positive price: OrderError and nothing recorded.
// -----------------------------------------------------------------------------
TEST_F(PaperTraderTest, NoUsablePriceThrowsOrderError) {
  EXPECT_THROW(trader.placeOrder(Side::Buy, 1), intraday::OrderError);

  setQuote("NSE:NIFTY24DECFUT", 0.0, 0.0, 0.0);
  try {
    trader.placeOrder(Side::Sell, 1);
    FAIL() << "expected OrderError";
  } catch (const intraday::OrderError& e) {
    EXPECT_NE(std::string(e.what()).find("BID"), std::string::npos);
  }

  EXPECT_TRUE(pm.snapshotOrders().empty());
  EXPECT_FALSE(pm.hasOpenPosition());
}

// -----------------------------------------------------------------------------
// 4. Non-positive lots are rejected before anything else happens.
// -----------------------------------------------------------------------------
TEST_F(PaperTraderTest, RejectsNonPositiveLots) {
  setQuote("NSE:NIFTY24DECFUT", 100.0, 99.0, 101.0);
  EXPECT_THROW(trader.placeOrder(Side::Buy, 0), std::invalid_argument);
  EXPECT_THROW(trader.placeOrder(Side::Sell, -3), std::invalid_argument);
  EXPECT_TRUE(pm.snapshotOrders().empty());
}

// -----------------------------------------------------------------------------
// 5. fetchCurrentPrice(): ltp of the current instrument, 0 when unknown.
// -----------------------------------------------------------------------------
TEST_F(PaperTraderTest, FetchCurrentPrice) {
  EXPECT_EQ(trader.fetchCurrentPrice(), 0.0);
  setQuote("NSE:NIFTY24DECFUT", 24155.5, 24155.0, 24156.0);
  EXPECT_DOUBLE_EQ(trader.fetchCurrentPrice(), 24155.5);
  EXPECT_TRUE(trader.isSimulated());
}

// -----------------------------------------------------------------------------
// 6. updateInstrument(): new symbol's quotes and lot size are used.
// -----------------------------------------------------------------------------
TEST_F(PaperTraderTest, UpdateInstrumentSwitchesSymbolAndLotSize) {
  intraday::domain::Instrument sbin;
  sbin.symbol = "NSE:SBIN-EQ";
  sbin.exchange = "NSE";
  sbin.lot_size = 1;
  trader.updateInstrument(sbin);

  EXPECT_EQ(trader.instrument().symbol, "NSE:SBIN-EQ");

  setQuote("NSE:SBIN-EQ", 800.0, 799.5, 800.5);
  auto buy = trader.placeOrder(Side::Buy, 10);
  ASSERT_TRUE(buy.has_value());
  EXPECT_EQ(pm.snapshotPosition().qty_units, 10);
  EXPECT_DOUBLE_EQ(buy->price, 800.5);
}

// -----------------------------------------------------------------------------
// 7. Orders are spaced by the configured minimum interval.
// -----------------------------------------------------------------------------
TEST(PaperTraderThrottleTest, EnforcesMinimumOrderInterval) {
  intraday::SimulationTimeProvider clock{1'733'900'000'000};
  intraday::Logger logger{clock, "", 1000, false};
  intraday::PositionManager pm{clock, logger, true};
  intraday::QuoteBook quotes;
  intraday::Quote q;
  q.ltp = 100.0;
  quotes.update("NSE:NIFTY24DECFUT", q);

  intraday::PaperTrader trader{pm,      quotes, logger, clock, nifty(),
                               std::chrono::milliseconds{60}};

  const auto start = std::chrono::steady_clock::now();
  trader.placeOrder(Side::Buy, 1);
  trader.placeOrder(Side::Buy, 1);
  trader.placeOrder(Side::Buy, 1);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_GE(elapsed, std::chrono::milliseconds{120});
  EXPECT_EQ(pm.openLots(), 3);
}
