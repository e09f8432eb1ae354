#pragma once

#include "intraday/domain/instrument.hpp"
#include "intraday/domain/order.hpp"
#include "intraday/domain/position.hpp"
#include "intraday/domain/session_stats.hpp"
#include "intraday/domain/trade.hpp"
#include "intraday/logging/logger.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace intraday {

// -----------------------------------------------------------------------------
// JSON views of ledger state
// -----------------------------------------------------------------------------
//
// @brief  Builds the nlohmann::json objects sent back on the command socket
//         and published as state telemetry.
//
// @details
// Money and percent fields are rounded to 2 decimals. Timestamps are local
// time: orders and logs as ISO-8601, trades as "YYYY-MM-DD HH:MM:SS" (the
// same text as the CSV export).
//
// Field names:
//   Position  → qty_lots, qty_units, total_value, avg_price, cmp, mtm,
//               mtm_change_percent
//   Order     → timestamp, type ("BUY"/"SELL"), quantity, price, order_id,
//               status
//   Trade     → entry_time, entry_price, entry_qty, exit_time, exit_price,
//               exit_qty, qty, pnl, pnl_percent, duration_seconds (whole
//               seconds, as in the CSV), turnover
//   Stats     → net_pnl, total_trades, winning_trades, losing_trades,
//               win_rate, total_turnover, avg_pnl
//   LogEntry  → timestamp, level, message
// -----------------------------------------------------------------------------

// Rounds to 2 decimal places (half away from zero).
double round2(double value);

nlohmann::json toJson(const domain::Position& position);
nlohmann::json toJson(const domain::Order& order);
nlohmann::json toJson(const domain::Trade& trade);
nlohmann::json toJson(const domain::SessionStats& stats);
nlohmann::json toJson(const domain::Instrument& instrument);
nlohmann::json toJson(const LogEntry& entry);

// Serializes for the wire. Strings that are not valid UTF-8 (operator
// input echoed into replies or log lines) have the bad bytes replaced with
// U+FFFD instead of throwing.
std::string dumpJson(const nlohmann::json& value);

template <typename T>
nlohmann::json toJsonArray(const std::vector<T>& items) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& item : items) {
    arr.push_back(toJson(item));
  }
  return arr;
}

}  // namespace intraday
