#pragma once

#include <cstdint>

namespace intraday {
namespace domain {

// -----------------------------------------------------------------------------
// Position — aggregate holding in the active instrument
// -----------------------------------------------------------------------------
//
// @brief  Quantity, cost basis and mark-to-market state of the single open
//         long position the session is trading.
//
// @details
// The authoritative copy lives inside PositionManager and is mutated in place
// on every fill and every price tick. Everything else sees copies.
//
// Invariants maintained by PositionManager:
//   qty_units   == qty_lots * lot_size
//   total_value == qty_units * avg_price
//   mtm         == qty_units * cmp - total_value   while qty_units > 0 and
//                                                  cmp > 0, otherwise 0
//   mtm_change_percent == mtm / total_value * 100  (0 when total_value <= 0)
//
// A default-constructed Position is the flat state; a SELL that takes
// qty_units to zero or below restores it exactly. cmp (last observed market
// price) is the one field a flattening SELL keeps.
// -----------------------------------------------------------------------------
struct Position {
  std::int64_t qty_lots{0};
  std::int64_t qty_units{0};
  double total_value{0.0};         // Cost value of the open units
  double avg_price{0.0};           // Volume-weighted average buy price
  double cmp{0.0};                 // Current market price
  double mtm{0.0};                 // Unrealized P&L at cmp
  double mtm_change_percent{0.0};  // mtm relative to total_value
};

}  // namespace domain
}  // namespace intraday
