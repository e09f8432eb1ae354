#pragma once

#include "intraday/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace intraday {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Responsibility: Encodes the direction of a fill. The ledger is long-only:
// BUY opens or adds to the position, SELL reduces or closes it.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// "BUY" / "SELL": the wire spelling used by commands, logs and JSON.
const char* toString(Side side);

// -------------------------------------------------------------------------
// parseSide(text)
// -------------------------------------------------------------------------
// @brief  Parses the wire spelling of a side.
//
// @return Side::Buy for "BUY", Side::Sell for "SELL", std::nullopt for
//         anything else (matching is case-sensitive).
// -------------------------------------------------------------------------
std::optional<Side> parseSide(const std::string& text);

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: One executed fill as reported by the order-execution
// collaborator (paper or live trader).
//
// @details
// Orders are value records. Once recorded by PositionManager::recordOrder()
// they are never mutated; the order history is append-only and is handed
// out by copy.
//
//   quantity  — filled quantity in LOTS, not units
//   price     — average fill price per unit
//   order_id : broker identifier ("PAPER000001" for simulated fills)
//   status    — broker status text ("Traded", "Paper Executed", ...)
// -----------------------------------------------------------------------------
struct Order {
  Timestamp timestamp{};
  Side side{Side::Buy};
  std::int64_t quantity{0};
  double price{0.0};
  std::string order_id;
  std::string status;
};

}  // namespace domain
}  // namespace intraday
