#include "intraday/domain/trade.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace intraday {
namespace domain {

// -----------------------------------------------------------------------------
// makeTrade(): build a closed round trip and derive its metrics
// -----------------------------------------------------------------------------
Trade makeTrade(Timestamp entry_time, double entry_price,
                std::int64_t entry_qty, Timestamp exit_time,
                double exit_price, std::int64_t exit_qty) {
  std::int64_t qty = std::min(entry_qty, exit_qty);
  if (qty <= 0) {
    throw std::invalid_argument("trade quantity must be positive, got " +
                                std::to_string(qty));
  }

  Trade t;
  t.entry_time = entry_time;
  t.entry_price = entry_price;
  t.entry_qty = entry_qty;
  t.exit_time = exit_time;
  t.exit_price = exit_price;
  t.exit_qty = exit_qty;

  t.qty = qty;
  t.pnl = (exit_price - entry_price) * static_cast<double>(qty);
  t.pnl_percent =
      entry_price > 0.0 ? (exit_price - entry_price) / entry_price * 100.0
                        : 0.0;
  t.duration_seconds = seconds_between(entry_time, exit_time);
  t.turnover = (entry_price + exit_price) * static_cast<double>(qty);
  return t;
}

}  // namespace domain
}  // namespace intraday
