#pragma once

#include "intraday/domain/order.hpp"
#include "intraday/domain/position.hpp"
#include "intraday/domain/session_stats.hpp"
#include "intraday/domain/trade.hpp"
#include "intraday/ledger/session_reporter.hpp"
#include "intraday/logging/logger.hpp"
#include "intraday/time/i_time_provider.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace intraday {

// -----------------------------------------------------------------------------
// PositionManager — the session's position and trade ledger
// -----------------------------------------------------------------------------
//
// @brief  Applies executed fills and price ticks to the single open long
//         position, reconstructs closed round-trip trades, and answers
//         consistent snapshot queries.
//
// @details
// The PositionManager owns all mutable accounting state:
//
//   1. position_        : quantity, cost basis and MTM of the open position.
//   2. orders_          : append-only history of recorded fills.
//   3. trades_          : append-only history of closed round trips.
//   4. pending_buys_    : BUY lots not yet matched by a SELL (simulation
//                         mode only). Used solely to reconstruct trades.
//   5. total_buy_cost_ /
//      total_buy_units_ : cumulative cost accumulators behind avg_price.
//   6. session_net_pnl_ : running sum of closed trade P&L.
//
// Cost basis math (applyFill):
//
//   BUY of u = lots * lot_size units at p:
//     total_buy_cost  += u * p
//     total_buy_units += u
//     avg_price        = total_buy_cost / total_buy_units
//     total_value      = qty_units * avg_price
//
//   SELL of u units:
//     total_buy_cost  -= (u / total_buy_units) * total_buy_cost
//     total_buy_units -= u
//     avg_price unchanged for the remaining units
//     qty_units <= 0  → exact reset of position and accumulators
//
// Trade reconstruction (simulation mode, LIFO):
//   A SELL walks pending_buys_ from the most recently pushed lot backwards,
//   consuming min(remaining, lot.qty) from each lot. All consumed lots
//   collapse into ONE Trade whose entry price is their volume-weighted
//   average and whose entry time is the earliest consumed timestamp. A SELL
//   larger than the pending buys is matched against what exists.
//
// Fills are assumed to arrive in execution order; the accumulator math does
// not try to repair out-of-order confirmations.
//
// Thread model:
//   One std::mutex guards every field above. Each public method holds it for
//   its full duration, so callers observe a total order of mutations and
//   snapshots are never torn. File I/O in exportTrades() runs outside the
//   lock on a copy of the trade history. Log lines produced under the lock
//   are collected and handed to the Logger after it is released.
//
// Ownership:
//   Owned by TradingSession for the lifetime of one trading session. Holds
//   references to the clock and logger, both of which must outlive it.
// -----------------------------------------------------------------------------
class PositionManager {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  clock            Time source for pending lots and trade exits.
  // @param  logger           Session logger.
  // @param  simulation_mode  Enables trade reconstruction. Fixed for the
  //                          lifetime of the manager.
  // @param  trades_dir       Directory used by exportTrades() when no path
  //                          is given.
  // -------------------------------------------------------------------------
  PositionManager(const ITimeProvider& clock, Logger& logger,
                  bool simulation_mode, std::string trades_dir = "trades");

  PositionManager(const PositionManager&) = delete;
  PositionManager& operator=(const PositionManager&) = delete;
  PositionManager(PositionManager&&) = delete;
  PositionManager& operator=(PositionManager&&) = delete;

  // Appends a fill record to the order history. No other effect.
  void recordOrder(domain::Order order);

  // -------------------------------------------------------------------------
  // applyFill(side, lots, price, lot_size)
  // -------------------------------------------------------------------------
  //
  // @brief  Applies one executed fill to the position.
  //
  // @param  side      Buy or Sell.
  // @param  lots      Filled lots. Expected > 0 (validated by the trader).
  // @param  price     Fill price per unit. Expected > 0.
  // @param  lot_size  Units per lot of the traded instrument.
  //
  // @details
  // See the class comment for the math. In simulation mode a BUY pushes a
  // pending lot and a SELL runs lot matching before the position is reduced.
  // MTM is recomputed afterwards whenever cmp > 0 and units > 0.
  //
  // Each call is a distinct market event: applying the same fill twice
  // changes the position twice.
  //
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  void applyFill(domain::Side side, std::int64_t lots, double price,
                 std::int64_t lot_size);

  // -------------------------------------------------------------------------
  // applyPriceTick(price)
  // -------------------------------------------------------------------------
  //
  // @brief  Records the latest market price and re-marks the open position.
  //
  // @details
  // cmp is stored as given. A non-positive price is logged as a warning and
  // leaves MTM at zero, since MTM is only computed while cmp > 0.
  //
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  void applyPriceTick(double price);

  domain::Position snapshotPosition() const;
  std::vector<domain::Order> snapshotOrders() const;
  std::vector<domain::Trade> snapshotTrades() const;
  domain::SessionStats sessionStats() const;

  std::int64_t openLots() const;
  bool hasOpenPosition() const;

  // -------------------------------------------------------------------------
  // reset()
  // -------------------------------------------------------------------------
  //
  // @brief  Returns the ledger to flat for an instrument switch.
  //
  // @details
  // Clears the position, order history, pending lots and cost accumulators.
  // In simulation mode the trade history and session net P&L survive, so a
  // paper session keeps its trade ledger across instruments; in live mode
  // they are cleared with everything else.
  // -------------------------------------------------------------------------
  void reset();

  // -------------------------------------------------------------------------
  // exportTrades(path)
  // -------------------------------------------------------------------------
  //
  // @brief  Writes the trade history as CSV.
  //
  // @param  path  Target file. When empty, trades_dir is created (if
  //               missing) and a file named paper_trades_YYYYMMDD_HHMMSS.csv
  //               is written inside it.
  //
  // @return See ExportResult. NothingToExport performs no I/O at all.
  //         Failures are logged and returned, never thrown.
  //
  // Thread-safety: The trade history is copied under the lock; the write
  //                happens after the lock is released.
  // -------------------------------------------------------------------------
  ExportResult exportTrades(const std::string& path = "") const;

  bool simulationMode() const { return simulation_mode_; }

 private:
  struct PendingBuyLot {
    Timestamp timestamp{};
    double price{0.0};
    std::int64_t qty{0};  // Remaining units
  };

  struct DeferredLog {
    LogLevel level;
    std::string message;
  };
  using DeferredLogs = std::vector<DeferredLog>;

  void flushLogs(const DeferredLogs& logs) const;

  void applyFillLocked(domain::Side side, std::int64_t lots, double price,
                       std::int64_t lot_size, DeferredLogs& logs);

  // Lock held by caller for these and applyFillLocked().
  void matchSell(std::int64_t sell_qty, double sell_price, DeferredLogs& logs);
  void recalculateMtm();
  void flatten();

  const ITimeProvider& clock_;
  Logger& logger_;
  const bool simulation_mode_;
  const std::string trades_dir_;

  mutable std::mutex mutex_;

  domain::Position position_;
  std::vector<domain::Order> orders_;
  std::vector<domain::Trade> trades_;
  std::deque<PendingBuyLot> pending_buys_;

  double total_buy_cost_{0.0};
  std::int64_t total_buy_units_{0};
  double session_net_pnl_{0.0};
};

}  // namespace intraday
