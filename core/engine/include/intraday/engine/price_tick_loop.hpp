#pragma once

#include "intraday/execution/i_trader.hpp"
#include "intraday/ledger/position_manager.hpp"
#include "intraday/logging/logger.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace intraday {

// -----------------------------------------------------------------------------
// PriceTickLoop — periodic mark-to-market refresh
// -----------------------------------------------------------------------------
//
// @brief  Background thread that re-prices the open position every
//         interval and notifies the session.
//
// @details
// Each iteration (pollOnce()):
//   1. Skip unless the ledger has an open position.
//   2. Ask the trader for the current price; skip unless it is positive.
//   3. PositionManager::applyPriceTick(price), then on_update_().
//
// The wait between iterations is a condition_variable wait_for so stop()
// interrupts it immediately instead of sleeping out the interval.
// A trader exception inside an iteration is logged and the loop carries on.
//
// Thread model:
//   start()/stop() from the owning thread. on_update_ runs on the loop
//   thread (or on the caller's thread for a direct pollOnce()).
// -----------------------------------------------------------------------------
class PriceTickLoop {
 public:
  using UpdateCallback = std::function<void()>;

  PriceTickLoop(PositionManager& positions, ITrader& trader, Logger& logger,
                std::chrono::milliseconds interval,
                UpdateCallback on_update = nullptr);

  ~PriceTickLoop();

  PriceTickLoop(const PriceTickLoop&) = delete;
  PriceTickLoop& operator=(const PriceTickLoop&) = delete;

  void start();
  void stop();

  // One iteration, synchronously. Returns true if a price was applied.
  bool pollOnce();

 private:
  void run();

  PositionManager& positions_;
  ITrader& trader_;
  Logger& logger_;
  const std::chrono::milliseconds interval_;
  UpdateCallback on_update_;

  std::mutex mutex_;
  std::condition_variable wake_;
  bool running_{false};
  std::thread thread_;
};

}  // namespace intraday
