#pragma once

#include <atomic>
#include <cstdint>

namespace intraday {

// -----------------------------------------------------------------------------
// OrderIdGenerator — thread-safe, monotonically increasing order sequence
// -----------------------------------------------------------------------------
//
// @brief  Produces 1, 2, 3, ... across any number of threads. PaperTrader
//         renders the value as "PAPER000001", "PAPER000002", ...
//
// @details
// fetch_add with relaxed ordering: the only requirement is uniqueness, there
// is no ordering relationship with other memory.
//
// Ownership:
//   Value member of PaperTrader. Non-copyable so two traders can never hand
//   out the same id from copies of one counter.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace intraday
