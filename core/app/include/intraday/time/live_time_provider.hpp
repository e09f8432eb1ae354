#pragma once

#include "intraday/time/i_time_provider.hpp"

namespace intraday {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used by a trading session running with the "wall" clock. Fills and trades
// are stamped with the moment they were applied to the ledger.
//
// Thread model:
//   No shared mutable state; safe to call from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace intraday
