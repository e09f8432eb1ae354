// =============================================================================
// position_manager_concurrency_test.cpp
// =============================================================================
// Concurrency tests for intraday::PositionManager.
//
// Validates:
//   - Fills from several threads are all applied (no lost updates)
//   - Snapshots taken while fills run are never torn: every observed
//     position satisfies total_value == qty_units * avg_price and
//     qty_lots * lot_size == qty_units
// =============================================================================

#include "intraday/ledger/position_manager.hpp"
#include "intraday/logging/logger.hpp"
#include "intraday/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cmath>
#include <thread>
#include <vector>

using intraday::domain::Side;

class PositionManagerConcurrencyTest : public ::testing::Test {
 protected:
  intraday::SimulationTimeProvider clock{1'733'900'000'000};
  intraday::Logger logger{clock, "", 1000, false};
  intraday::PositionManager pm{clock, logger, /*simulation_mode=*/true};
};

// -----------------------------------------------------------------------------
// 1. Four threads each BUY 250 single lots: exactly 1000 lots at the end.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerConcurrencyTest, ConcurrentBuysAreAllApplied) {
  constexpr int kThreads = 4;
  constexpr int kFillsPerThread = 250;
  constexpr std::int64_t kLotSize = 25;

  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([this] {
      for (int i = 0; i < kFillsPerThread; ++i) {
        pm.applyFill(Side::Buy, 1, 100.0, kLotSize);
      }
    });
  }
  for (auto& w : workers) w.join();

  auto pos = pm.snapshotPosition();
  EXPECT_EQ(pos.qty_lots, kThreads * kFillsPerThread);
  EXPECT_EQ(pos.qty_units, kThreads * kFillsPerThread * kLotSize);
  EXPECT_DOUBLE_EQ(pos.avg_price, 100.0);
}

// -----------------------------------------------------------------------------
// 2. Buy/sell pairs racing against snapshot readers and price ticks.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerConcurrencyTest, SnapshotsNeverObserveTornState) {
  constexpr int kRounds = 500;
  constexpr std::int64_t kLotSize = 10;

  std::atomic<bool> done{false};
  std::atomic<int> violations{0};

  std::thread writer([this] {
    for (int i = 0; i < kRounds; ++i) {
      pm.applyFill(Side::Buy, 2, 100.0 + (i % 7), kLotSize);
      pm.applyFill(Side::Sell, 1, 101.0, kLotSize);
      pm.applyFill(Side::Sell, 1, 102.0, kLotSize);
    }
  });

  std::thread ticker([this, &done] {
    double price = 100.0;
    while (!done.load()) {
      pm.applyPriceTick(price);
      price = price > 110.0 ? 100.0 : price + 0.5;
    }
  });

  std::vector<std::thread> readers;
  for (int r = 0; r < 2; ++r) {
    readers.emplace_back([this, &done, &violations] {
      while (!done.load()) {
        auto pos = pm.snapshotPosition();
        if (pos.qty_lots * kLotSize != pos.qty_units) {
          violations.fetch_add(1);
        }
        double expected = static_cast<double>(pos.qty_units) * pos.avg_price;
        if (std::fabs(pos.total_value - expected) > 1e-6) {
          violations.fetch_add(1);
        }
        pm.snapshotTrades();
        pm.sessionStats();
      }
    });
  }

  writer.join();
  done.store(true);
  ticker.join();
  for (auto& r : readers) r.join();

  EXPECT_EQ(violations.load(), 0);
  EXPECT_FALSE(pm.hasOpenPosition());
  EXPECT_EQ(pm.snapshotTrades().size(), static_cast<std::size_t>(2 * kRounds));
}
