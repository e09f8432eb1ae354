#pragma once

#include <cstdint>

namespace intraday {
namespace domain {

// -----------------------------------------------------------------------------
// SessionStats — aggregate statistics over the session's trade history
// -----------------------------------------------------------------------------
// Computed on demand by computeSessionStats(). net_pnl is the running sum
// accumulated as trades are created; the other fields are derived from the
// trade list itself. All fields are zero when no trade has closed yet.
// -----------------------------------------------------------------------------
struct SessionStats {
  double net_pnl{0.0};
  std::int64_t total_trades{0};
  std::int64_t winning_trades{0};  // pnl > 0
  std::int64_t losing_trades{0};   // pnl < 0
  double win_rate{0.0};            // percent, 0..100
  double total_turnover{0.0};
  double avg_pnl{0.0};
};

}  // namespace domain
}  // namespace intraday
