#pragma once

#include "intraday/domain/session_stats.hpp"
#include "intraday/domain/trade.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace intraday {

// -----------------------------------------------------------------------------
// ExportStatus / ExportResult — outcome of a CSV trade export
// -----------------------------------------------------------------------------
//
// @details
// "Nothing to export" and "the write failed" are different outcomes and are
// reported as such. path is empty unless status == Exported, so callers that
// only want the old "path or empty" contract can keep reading path alone.
// message carries the I/O error text for Failed.
// -----------------------------------------------------------------------------
enum class ExportStatus {
  Exported,
  NothingToExport,
  Failed,
};

struct ExportResult {
  ExportStatus status{ExportStatus::NothingToExport};
  std::string path;
  std::string message;

  bool ok() const { return status == ExportStatus::Exported; }
};

// Fixed CSV header, in column order.
inline constexpr const char* kTradesCsvHeader =
    "entry_time,entry_price,entry_qty,exit_time,exit_price,exit_qty,qty,"
    "pnl,pnl_percent,duration_seconds,turnover";

// -----------------------------------------------------------------------------
// computeSessionStats(trades, session_net_pnl)
// -----------------------------------------------------------------------------
//
// @brief  Derives win/loss counts, win rate, turnover and average P&L from a
//         trade history.
//
// @param  trades           The full trade history, in creation order.
// @param  session_net_pnl  Running P&L accumulated as trades were created.
//                          Passed through as net_pnl and used for avg_pnl.
//
// @return All-zero stats (except net_pnl) when trades is empty.
//
// Pure function; safe to call from any thread on a private copy.
// -----------------------------------------------------------------------------
domain::SessionStats computeSessionStats(
    const std::vector<domain::Trade>& trades, double session_net_pnl);

// -----------------------------------------------------------------------------
// writeTradesCsv(out, trades)
// -----------------------------------------------------------------------------
//
// @brief  Writes the header row followed by one row per trade.
//
// @details
// Row format:
//   entry_time / exit_time   "YYYY-MM-DD HH:MM:SS" (local time)
//   entry_price, exit_price,
//   pnl, pnl_percent,
//   turnover                 fixed, two decimals
//   entry_qty, exit_qty, qty integers (units)
//   duration_seconds         truncated to an integer
// -----------------------------------------------------------------------------
void writeTradesCsv(std::ostream& out,
                    const std::vector<domain::Trade>& trades);

// -----------------------------------------------------------------------------
// exportTradesCsv(path, trades)
// -----------------------------------------------------------------------------
//
// @brief  Writes trades to a CSV file at path (truncating any existing file).
//
// @return NothingToExport when trades is empty (no file is touched),
//         Exported with the path on success, Failed with a message when the
//         file cannot be opened or written. Never throws on I/O failure.
// -----------------------------------------------------------------------------
ExportResult exportTradesCsv(const std::string& path,
                             const std::vector<domain::Trade>& trades);

}  // namespace intraday
