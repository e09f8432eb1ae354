#pragma once

#include <chrono>
#include <mutex>

namespace intraday {

// -----------------------------------------------------------------------------
// OrderThrottle — minimum spacing between consecutive orders
// -----------------------------------------------------------------------------
//
// @brief  acquire() sleeps until at least min_interval has passed since the
//         previous acquire(), then records the new send time.
//
// @details
// Uses steady_clock, independent of the session's ITimeProvider: the spacing
// protects the broker's rate limit in real time even when the ledger runs on
// a replayed clock. A zero interval never sleeps.
//
// Thread model: Concurrent callers are serialized; each waits its turn.
// -----------------------------------------------------------------------------
class OrderThrottle {
 public:
  explicit OrderThrottle(std::chrono::milliseconds min_interval)
      : min_interval_(min_interval) {}

  void acquire();

 private:
  const std::chrono::milliseconds min_interval_;
  std::mutex mutex_;
  std::chrono::steady_clock::time_point last_{};
  bool has_last_{false};
};

}  // namespace intraday
