#include "intraday/engine/price_tick_loop.hpp"

#include <exception>
#include <string>
#include <utility>

namespace intraday {

PriceTickLoop::PriceTickLoop(PositionManager& positions, ITrader& trader,
                             Logger& logger,
                             std::chrono::milliseconds interval,
                             UpdateCallback on_update)
    : positions_(positions),
      trader_(trader),
      logger_(logger),
      interval_(interval),
      on_update_(std::move(on_update)) {}

PriceTickLoop::~PriceTickLoop() { stop(); }

void PriceTickLoop::start() {
  std::lock_guard lock(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this] { run(); });
}

void PriceTickLoop::stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  wake_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
  }
}

// -----------------------------------------------------------------------------
// pollOnce(): one mark-to-market refresh
// -----------------------------------------------------------------------------
bool PriceTickLoop::pollOnce() {
  if (!positions_.hasOpenPosition()) {
    return false;
  }

  double price = 0.0;
  try {
    price = trader_.fetchCurrentPrice();
  } catch (const std::exception& e) {
    logger_.warn(std::string("[PriceTickLoop] price fetch failed: ") +
                 e.what());
    return false;
  }

  if (price <= 0.0) {
    return false;
  }

  positions_.applyPriceTick(price);
  if (on_update_) {
    on_update_();
  }
  return true;
}

void PriceTickLoop::run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    wake_.wait_for(lock, interval_, [this] { return !running_; });
    if (!running_) {
      break;
    }

    lock.unlock();
    pollOnce();
    lock.lock();
  }
}

}  // namespace intraday
