#pragma once

#include "intraday/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace intraday {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally-driven clock for replay and tests
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider implementation whose "current time" is set explicitly
//         rather than read from the system clock.
//
// @details
// In the "replay" clock mode the MarketDataGateway receives a tick with
// timestamp_ms and calls advance_time() before storing the quote. From that
// point on every fill, trade and log line is stamped with the replayed
// market time, so a recorded session replays into an identical trade ledger.
//
// Tests drive the clock directly:
//
//   SimulationTimeProvider clock;
//   clock.advance_time(1'700'000'000'000);
//   manager.applyFill(Side::Buy, 1, 100.0, 25);
//   clock.advance_time(1'700'000'090'000);
//   manager.applyFill(Side::Sell, 1, 101.0, 25);  // duration 90 s
//
// Internal storage:
//   std::atomic<int64_t> current_time_ms_. A single writer (feed thread or
//   test) and many readers; an atomic gives visibility without a mutex.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // Starts at 0 ms ("no data replayed yet").
  SimulationTimeProvider() = default;

  // Starts at the given epoch milliseconds.
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  // -------------------------------------------------------------------------
  // now_ms() override
  // -------------------------------------------------------------------------
  // @brief  Returns the last time set by advance_time().
  //
  // Thread-safety: Safe to call from any thread. Lock-free on 64-bit
  //                platforms.
  // -------------------------------------------------------------------------
  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the simulation clock to the given timestamp.
  //
  // @param  new_time_ms  Epoch milliseconds. Monotonicity is the caller's
  //                      responsibility and is not enforced here.
  //
  // Thread-safety: Safe to call from any thread; intended single-writer.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace intraday
