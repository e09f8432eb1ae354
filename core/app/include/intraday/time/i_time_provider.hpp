#pragma once

#include <cstdint>

namespace intraday {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// Every timestamp the ledger records (order fills, pending buy lots, trade
// entry/exit times, log lines, export filenames) is taken from an injected
// ITimeProvider:
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value set by the market data feed
//                              (replay clock mode) or by a test.
//
// With a simulated clock, trade durations and CSV timestamps are fully
// reproducible, which is what the ledger tests rely on.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//   The PositionManager reads the clock under its own lock, the price-tick
//   thread and the IPC thread read it through the Logger.
//
// Ownership:
//   Components hold a const reference; they do NOT own the provider.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch.
  //
  // @return May be 0 before a simulation clock has been advanced.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace intraday
