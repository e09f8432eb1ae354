// =============================================================================
// json_codec_test.cpp
// =============================================================================
// Unit tests for the JSON views sent on the IPC sockets.
//
// Validates field names, rounding to 2 decimals, side spelling, timestamp
// formatting, and that serialization survives non-UTF-8 log text.
// =============================================================================

#include "intraday/serialization/json_codec.hpp"
#include "intraday/logging/logger.hpp"
#include "intraday/time/simulation_time_provider.hpp"
#include "intraday/time/time_utils.hpp"

#include <gtest/gtest.h>

using nlohmann::json;

TEST(JsonCodecTest, Round2) {
  EXPECT_DOUBLE_EQ(intraday::round2(103.33333), 103.33);
  EXPECT_DOUBLE_EQ(intraday::round2(2.345001), 2.35);
  EXPECT_DOUBLE_EQ(intraday::round2(-1.006), -1.01);
  EXPECT_DOUBLE_EQ(intraday::round2(0.0), 0.0);
}

TEST(JsonCodecTest, PositionFields) {
  intraday::domain::Position pos;
  pos.qty_lots = 3;
  pos.qty_units = 75;
  pos.total_value = 7650.0;
  pos.avg_price = 102.0;
  pos.cmp = 103.456;
  pos.mtm = 109.2;
  pos.mtm_change_percent = 1.427451;

  json j = intraday::toJson(pos);
  EXPECT_EQ(j.at("qty_lots").get<std::int64_t>(), 3);
  EXPECT_EQ(j.at("qty_units").get<std::int64_t>(), 75);
  EXPECT_DOUBLE_EQ(j.at("cmp").get<double>(), 103.46);
  EXPECT_DOUBLE_EQ(j.at("mtm_change_percent").get<double>(), 1.43);
  EXPECT_EQ(j.size(), 7u);
}

TEST(JsonCodecTest, OrderUsesTypeAndIsoTime) {
  intraday::domain::Order order;
  order.timestamp = intraday::ms_to_timestamp(1'733'900'000'000);
  order.side = intraday::domain::Side::Sell;
  order.quantity = 2;
  order.price = 24150.257;
  order.order_id = "PAPER000007";
  order.status = "Paper Executed";

  json j = intraday::toJson(order);
  EXPECT_EQ(j.at("type"), "SELL");
  EXPECT_EQ(j.at("quantity"), 2);
  EXPECT_DOUBLE_EQ(j.at("price").get<double>(), 24150.26);
  EXPECT_EQ(j.at("order_id"), "PAPER000007");
  EXPECT_EQ(j.at("status"), "Paper Executed");
  EXPECT_EQ(j.at("timestamp"), intraday::format_iso(order.timestamp));
}

TEST(JsonCodecTest, TradeAndStats) {
  const auto entry = intraday::ms_to_timestamp(1'733'900'000'000);
  const auto exit = intraday::ms_to_timestamp(1'733'900'062'000);
  auto trade = intraday::domain::makeTrade(entry, 1550.0 / 15.0, 15, exit,
                                           120.0, 15);

  json t = intraday::toJson(trade);
  EXPECT_EQ(t.at("entry_time"), intraday::format_timestamp(entry));
  EXPECT_DOUBLE_EQ(t.at("entry_price").get<double>(), 103.33);
  EXPECT_DOUBLE_EQ(t.at("pnl").get<double>(), 250.0);
  EXPECT_TRUE(t.at("duration_seconds").is_number_integer());
  EXPECT_EQ(t.at("duration_seconds").get<std::int64_t>(), 62);
  EXPECT_EQ(t.at("qty"), 15);

  intraday::domain::SessionStats stats;
  stats.net_pnl = 250.0;
  stats.total_trades = 3;
  stats.winning_trades = 1;
  stats.win_rate = 100.0 / 3.0;
  json s = intraday::toJson(stats);
  EXPECT_DOUBLE_EQ(s.at("win_rate").get<double>(), 33.33);
  EXPECT_EQ(s.at("total_trades"), 3);
  EXPECT_EQ(s.at("losing_trades"), 0);
}

TEST(JsonCodecTest, ArraysOfLogEntries) {
  std::vector<intraday::LogEntry> entries(2);
  entries[0].level = intraday::LogLevel::Warn;
  entries[0].message = "No open positions to close";
  entries[1].level = intraday::LogLevel::Error;
  entries[1].message = "Buy order failed";

  json arr = intraday::toJsonArray(entries);
  ASSERT_TRUE(arr.is_array());
  ASSERT_EQ(arr.size(), 2u);
  EXPECT_EQ(arr[0].at("level"), "WARN");
  EXPECT_EQ(arr[1].at("message"), "Buy order failed");

  EXPECT_TRUE(intraday::toJsonArray(std::vector<intraday::domain::Trade>{})
                  .is_array());
}

TEST(JsonCodecTest, DurationTruncatesToWholeSeconds) {
  const auto entry = intraday::ms_to_timestamp(1'733'900'000'000);
  const auto exit = intraday::ms_to_timestamp(1'733'900'045'900);
  auto trade = intraday::domain::makeTrade(entry, 100.0, 1, exit, 101.0, 1);

  json t = intraday::toJson(trade);
  EXPECT_EQ(t.at("duration_seconds").get<std::int64_t>(), 45);
}

TEST(JsonCodecTest, DumpSurvivesInvalidUtf8InLogs) {
  intraday::SimulationTimeProvider clock{1'733'900'000'000};
  intraday::Logger logger{clock, "", 1000, false};
  logger.error("[IpcServer] command 'FOO\xff' failed: x");

  json state;
  state["logs"] = intraday::toJsonArray(logger.entries());

  std::string text;
  ASSERT_NO_THROW(text = intraday::dumpJson(state));
  EXPECT_NE(text.find("FOO\xEF\xBF\xBD"), std::string::npos);

  json reparsed = json::parse(text);
  EXPECT_EQ(reparsed.at("logs").size(), 1u);
}
