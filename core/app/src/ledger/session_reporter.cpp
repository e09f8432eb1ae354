#include "intraday/ledger/session_reporter.hpp"

#include "intraday/time/time_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>

namespace intraday {

// -----------------------------------------------------------------------------
// computeSessionStats()
// -----------------------------------------------------------------------------
domain::SessionStats computeSessionStats(
    const std::vector<domain::Trade>& trades, double session_net_pnl) {
  domain::SessionStats stats;
  stats.net_pnl = session_net_pnl;
  stats.total_trades = static_cast<std::int64_t>(trades.size());

  for (const auto& t : trades) {
    if (t.pnl > 0.0) {
      ++stats.winning_trades;
    } else if (t.pnl < 0.0) {
      ++stats.losing_trades;
    }
    stats.total_turnover += t.turnover;
  }

  if (stats.total_trades > 0) {
    auto total = static_cast<double>(stats.total_trades);
    stats.win_rate = static_cast<double>(stats.winning_trades) / total * 100.0;
    stats.avg_pnl = session_net_pnl / total;
  }
  return stats;
}

// -----------------------------------------------------------------------------
// writeTradesCsv()
// -----------------------------------------------------------------------------
void writeTradesCsv(std::ostream& out,
                    const std::vector<domain::Trade>& trades) {
  out << kTradesCsvHeader << '\n';

  out << std::fixed << std::setprecision(2);
  for (const auto& t : trades) {
    out << format_timestamp(t.entry_time) << ',' << t.entry_price << ','
        << t.entry_qty << ',' << format_timestamp(t.exit_time) << ','
        << t.exit_price << ',' << t.exit_qty << ',' << t.qty << ',' << t.pnl
        << ',' << t.pnl_percent << ','
        << static_cast<std::int64_t>(t.duration_seconds) << ',' << t.turnover
        << '\n';
  }
}

// -----------------------------------------------------------------------------
// exportTradesCsv()
// -----------------------------------------------------------------------------
ExportResult exportTradesCsv(const std::string& path,
                             const std::vector<domain::Trade>& trades) {
  ExportResult result;
  if (trades.empty()) {
    result.status = ExportStatus::NothingToExport;
    return result;
  }

  std::ofstream file(path, std::ios::out | std::ios::trunc);
  if (!file.is_open()) {
    result.status = ExportStatus::Failed;
    result.message = "cannot open " + path + ": " + std::strerror(errno);
    return result;
  }

  writeTradesCsv(file, trades);
  file.close();

  if (file.fail()) {
    result.status = ExportStatus::Failed;
    result.message = "write to " + path + " failed";
    return result;
  }

  result.status = ExportStatus::Exported;
  result.path = path;
  return result;
}

}  // namespace intraday
