#pragma once

#include "intraday/time/time_utils.hpp"

#include <cstdint>

namespace intraday {
namespace domain {

// -----------------------------------------------------------------------------
// Trade — one closed round trip
// -----------------------------------------------------------------------------
//
// @brief  Pairs an aggregated entry (one or more BUY lots) with the SELL that
//         closed it, and carries the derived P&L metrics.
//
// @details
// Trades are produced only by the PositionManager's lot-matching step and
// are never mutated afterwards. All quantities are in UNITS (lots ×
// lot_size), because pending buy lots are tracked in units.
//
// Derived fields, computed once by makeTrade():
//
//   qty              = min(entry_qty, exit_qty)
//   pnl              = (exit_price - entry_price) * qty
//   pnl_percent      = (exit_price - entry_price) / entry_price * 100
//                      (0 when entry_price <= 0)
//   duration_seconds = exit_time - entry_time
//   turnover         = (entry_price + exit_price) * qty
//
// Thread model:
//   Plain value type. Copies handed out by snapshotTrades() are independent
//   of the ledger's internal history.
// -----------------------------------------------------------------------------
struct Trade {
  Timestamp entry_time{};
  double entry_price{0.0};
  std::int64_t entry_qty{0};

  Timestamp exit_time{};
  double exit_price{0.0};
  std::int64_t exit_qty{0};

  std::int64_t qty{0};
  double pnl{0.0};
  double pnl_percent{0.0};
  double duration_seconds{0.0};
  double turnover{0.0};
};

// -------------------------------------------------------------------------
// makeTrade(...)
// -------------------------------------------------------------------------
// @brief  Builds a Trade and computes its derived metrics.
//
// @throws std::invalid_argument if min(entry_qty, exit_qty) <= 0. A trade
//         with nothing matched means the caller's bookkeeping is broken;
//         the matching step catches this and logs it.
// -------------------------------------------------------------------------
Trade makeTrade(Timestamp entry_time, double entry_price,
                std::int64_t entry_qty, Timestamp exit_time,
                double exit_price, std::int64_t exit_qty);

}  // namespace domain
}  // namespace intraday
