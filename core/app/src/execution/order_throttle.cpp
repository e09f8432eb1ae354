#include "intraday/execution/order_throttle.hpp"

#include <thread>

namespace intraday {

void OrderThrottle::acquire() {
  std::lock_guard lock(mutex_);

  auto now = std::chrono::steady_clock::now();
  if (has_last_ && min_interval_.count() > 0) {
    auto ready_at = last_ + min_interval_;
    if (now < ready_at) {
      std::this_thread::sleep_for(ready_at - now);
      now = std::chrono::steady_clock::now();
    }
  }

  last_ = now;
  has_last_ = true;
}

}  // namespace intraday
