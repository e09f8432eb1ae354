#include "intraday/ledger/position_manager.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace intraday {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
PositionManager::PositionManager(const ITimeProvider& clock, Logger& logger,
                                 bool simulation_mode, std::string trades_dir)
    : clock_(clock),
      logger_(logger),
      simulation_mode_(simulation_mode),
      trades_dir_(std::move(trades_dir)) {}

// -----------------------------------------------------------------------------
// recordOrder: append to the order history
// -----------------------------------------------------------------------------
void PositionManager::recordOrder(domain::Order order) {
  std::lock_guard lock(mutex_);
  orders_.push_back(std::move(order));
}

// -----------------------------------------------------------------------------
// applyFill: the core position mutation
// -----------------------------------------------------------------------------
void PositionManager::applyFill(domain::Side side, std::int64_t lots,
                                double price, std::int64_t lot_size) {
  DeferredLogs logs;
  {
    std::lock_guard lock(mutex_);
    applyFillLocked(side, lots, price, lot_size, logs);
  }
  flushLogs(logs);
}

void PositionManager::applyFillLocked(domain::Side side, std::int64_t lots,
                                      double price, std::int64_t lot_size,
                                      DeferredLogs& logs) {

  const std::int64_t units = lots * lot_size;
  const double value = static_cast<double>(units) * price;

  if (side == domain::Side::Buy) {
    // --- BUY: grow the position and the cost accumulators ------------------
    total_buy_cost_ += value;
    total_buy_units_ += units;

    position_.qty_units += units;
    position_.qty_lots += lots;

    if (total_buy_units_ > 0) {
      position_.avg_price =
          total_buy_cost_ / static_cast<double>(total_buy_units_);
    }
    position_.total_value =
        static_cast<double>(position_.qty_units) * position_.avg_price;

    if (simulation_mode_) {
      pending_buys_.push_back(
          PendingBuyLot{ms_to_timestamp(clock_.now_ms()), price, units});
    }
  } else {
    // --- SELL: close trades first, then shrink the position -----------------
    if (simulation_mode_) {
      matchSell(units, price, logs);
    }

    position_.qty_units -= units;
    position_.qty_lots -= lots;

    // Shrink the accumulators by the fraction of buy volume sold. The ratio
    // cost/units (avg_price) is preserved for the remaining units.
    if (total_buy_units_ > 0) {
      double reduction = static_cast<double>(units) /
                         static_cast<double>(total_buy_units_) *
                         total_buy_cost_;
      total_buy_cost_ -= reduction;
      total_buy_units_ -= units;
    }

    if (position_.qty_units <= 0) {
      flatten();
    } else {
      position_.total_value =
          static_cast<double>(position_.qty_units) * position_.avg_price;
    }
  }

  if (position_.cmp > 0.0 && position_.qty_units > 0) {
    recalculateMtm();
  }
}

// -----------------------------------------------------------------------------
// matchSell: LIFO lot matching, collapsing into one Trade per SELL
// -----------------------------------------------------------------------------
void PositionManager::matchSell(std::int64_t sell_qty, double sell_price,
                                DeferredLogs& logs) {
  if (sell_qty <= 0) {
    std::ostringstream msg;
    msg << "[PositionManager] Invalid sell quantity for trade matching: "
        << sell_qty;
    logs.push_back({LogLevel::Warn, msg.str()});
    return;
  }
  if (sell_price <= 0.0) {
    std::ostringstream msg;
    msg << "[PositionManager] Invalid sell price for trade matching: "
        << sell_price;
    logs.push_back({LogLevel::Warn, msg.str()});
    return;
  }

  const Timestamp exit_time = ms_to_timestamp(clock_.now_ms());

  std::int64_t remaining = sell_qty;
  std::int64_t matched_total = 0;
  double matched_value = 0.0;
  Timestamp earliest_entry = Timestamp::max();

  // Newest lot first. Every lot except possibly the last one visited is
  // consumed entirely, so removal only ever happens at the back.
  while (remaining > 0 && !pending_buys_.empty()) {
    PendingBuyLot& lot = pending_buys_.back();

    std::int64_t matched = std::min(remaining, lot.qty);
    if (matched > 0) {
      matched_total += matched;
      matched_value += static_cast<double>(matched) * lot.price;
      earliest_entry = std::min(earliest_entry, lot.timestamp);

      lot.qty -= matched;
      remaining -= matched;
    }

    if (lot.qty <= 0) {
      pending_buys_.pop_back();
    }
  }

  if (matched_total <= 0 || matched_value <= 0.0) {
    return;
  }

  const double entry_price = matched_value / static_cast<double>(matched_total);

  try {
    domain::Trade trade =
        domain::makeTrade(earliest_entry, entry_price, matched_total,
                          exit_time, sell_price, matched_total);
    session_net_pnl_ += trade.pnl;
    trades_.push_back(trade);
  } catch (const std::invalid_argument& e) {
    // The position update still goes ahead; history is secondary to risk.
    logs.push_back({LogLevel::Error,
                     std::string("[PositionManager] Error creating trade "
                                 "record: ") +
                         e.what()});
  }
}

// -----------------------------------------------------------------------------
// applyPriceTick: update cmp and re-mark
// -----------------------------------------------------------------------------
void PositionManager::applyPriceTick(double price) {
  {
    std::lock_guard lock(mutex_);
    position_.cmp = price;
    if (position_.qty_units > 0) {
      recalculateMtm();
    }
  }

  if (price <= 0.0) {
    std::ostringstream msg;
    msg << "[PositionManager] Non-positive price tick: " << price;
    logger_.warn(msg.str());
  }
}

void PositionManager::flushLogs(const DeferredLogs& logs) const {
  for (const auto& entry : logs) {
    logger_.log(entry.level, entry.message);
  }
}

// -----------------------------------------------------------------------------
// recalculateMtm: mark-to-market at cmp (lock held)
// -----------------------------------------------------------------------------
void PositionManager::recalculateMtm() {
  if (position_.qty_units <= 0 || position_.cmp <= 0.0) {
    position_.mtm = 0.0;
    position_.mtm_change_percent = 0.0;
    return;
  }

  double current_value = static_cast<double>(position_.qty_units) * position_.cmp;
  position_.mtm = current_value - position_.total_value;

  if (position_.total_value > 0.0) {
    position_.mtm_change_percent = position_.mtm / position_.total_value * 100.0;
  } else {
    position_.mtm_change_percent = 0.0;
  }
}

// -----------------------------------------------------------------------------
// flatten: exact zero after a closing SELL (lock held). cmp is kept.
// -----------------------------------------------------------------------------
void PositionManager::flatten() {
  position_.qty_units = 0;
  position_.qty_lots = 0;
  position_.total_value = 0.0;
  position_.avg_price = 0.0;
  position_.mtm = 0.0;
  position_.mtm_change_percent = 0.0;
  total_buy_cost_ = 0.0;
  total_buy_units_ = 0;
}

// -----------------------------------------------------------------------------
// Snapshots: copies under the lock
// -----------------------------------------------------------------------------
domain::Position PositionManager::snapshotPosition() const {
  std::lock_guard lock(mutex_);
  return position_;
}

std::vector<domain::Order> PositionManager::snapshotOrders() const {
  std::lock_guard lock(mutex_);
  return orders_;
}

std::vector<domain::Trade> PositionManager::snapshotTrades() const {
  std::lock_guard lock(mutex_);
  return trades_;
}

domain::SessionStats PositionManager::sessionStats() const {
  std::lock_guard lock(mutex_);
  return computeSessionStats(trades_, session_net_pnl_);
}

std::int64_t PositionManager::openLots() const {
  std::lock_guard lock(mutex_);
  return position_.qty_lots;
}

bool PositionManager::hasOpenPosition() const {
  std::lock_guard lock(mutex_);
  return position_.qty_units != 0;
}

// -----------------------------------------------------------------------------
// reset: back to flat for an instrument switch
// -----------------------------------------------------------------------------
void PositionManager::reset() {
  std::lock_guard lock(mutex_);

  position_ = domain::Position{};
  orders_.clear();
  pending_buys_.clear();
  total_buy_cost_ = 0.0;
  total_buy_units_ = 0;

  if (!simulation_mode_) {
    trades_.clear();
    session_net_pnl_ = 0.0;
  }
}

// -----------------------------------------------------------------------------
// exportTrades: copy under the lock, write outside it
// -----------------------------------------------------------------------------
ExportResult PositionManager::exportTrades(const std::string& path) const {
  std::vector<domain::Trade> trades = snapshotTrades();

  if (trades.empty()) {
    logger_.info("[PositionManager] No trades to export.");
    return ExportResult{ExportStatus::NothingToExport, "", ""};
  }

  std::string target = path;
  if (target.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(trades_dir_, ec);
    if (ec) {
      std::string message = "cannot create " + trades_dir_ + ": " + ec.message();
      logger_.error("[PositionManager] Failed to create trades directory: " +
                    message);
      return ExportResult{ExportStatus::Failed, "", message};
    }

    std::string filename =
        "paper_trades_" + format_compact(ms_to_timestamp(clock_.now_ms())) +
        ".csv";
    target = (std::filesystem::path(trades_dir_) / filename).string();
  }

  ExportResult result = exportTradesCsv(target, trades);
  if (result.status == ExportStatus::Failed) {
    logger_.error("[PositionManager] Failed to export trades: " +
                  result.message);
  } else if (result.ok()) {
    logger_.info("[PositionManager] Exported " + std::to_string(trades.size()) +
                 " trade(s) to " + result.path);
  }
  return result;
}

}  // namespace intraday
