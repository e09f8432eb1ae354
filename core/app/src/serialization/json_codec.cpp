#include "intraday/serialization/json_codec.hpp"

#include "intraday/time/time_utils.hpp"

#include <cmath>
#include <cstdint>

namespace intraday {

double round2(double value) { return std::round(value * 100.0) / 100.0; }

std::string dumpJson(const nlohmann::json& value) {
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json toJson(const domain::Position& position) {
  nlohmann::json j;
  j["qty_lots"] = position.qty_lots;
  j["qty_units"] = position.qty_units;
  j["total_value"] = round2(position.total_value);
  j["avg_price"] = round2(position.avg_price);
  j["cmp"] = round2(position.cmp);
  j["mtm"] = round2(position.mtm);
  j["mtm_change_percent"] = round2(position.mtm_change_percent);
  return j;
}

nlohmann::json toJson(const domain::Order& order) {
  nlohmann::json j;
  j["timestamp"] = format_iso(order.timestamp);
  j["type"] = domain::toString(order.side);
  j["quantity"] = order.quantity;
  j["price"] = round2(order.price);
  j["order_id"] = order.order_id;
  j["status"] = order.status;
  return j;
}

nlohmann::json toJson(const domain::Trade& trade) {
  nlohmann::json j;
  j["entry_time"] = format_timestamp(trade.entry_time);
  j["entry_price"] = round2(trade.entry_price);
  j["entry_qty"] = trade.entry_qty;
  j["exit_time"] = format_timestamp(trade.exit_time);
  j["exit_price"] = round2(trade.exit_price);
  j["exit_qty"] = trade.exit_qty;
  j["qty"] = trade.qty;
  j["pnl"] = round2(trade.pnl);
  j["pnl_percent"] = round2(trade.pnl_percent);
  j["duration_seconds"] = static_cast<std::int64_t>(trade.duration_seconds);
  j["turnover"] = round2(trade.turnover);
  return j;
}

nlohmann::json toJson(const domain::SessionStats& stats) {
  nlohmann::json j;
  j["net_pnl"] = round2(stats.net_pnl);
  j["total_trades"] = stats.total_trades;
  j["winning_trades"] = stats.winning_trades;
  j["losing_trades"] = stats.losing_trades;
  j["win_rate"] = round2(stats.win_rate);
  j["total_turnover"] = round2(stats.total_turnover);
  j["avg_pnl"] = round2(stats.avg_pnl);
  return j;
}

nlohmann::json toJson(const domain::Instrument& instrument) {
  nlohmann::json j;
  j["symbol"] = instrument.symbol;
  j["exchange"] = instrument.exchange;
  j["lot_size"] = instrument.lot_size;
  j["product"] = instrument.product;
  return j;
}

nlohmann::json toJson(const LogEntry& entry) {
  nlohmann::json j;
  j["timestamp"] = format_iso(entry.timestamp);
  j["level"] = toString(entry.level);
  j["message"] = entry.message;
  return j;
}

}  // namespace intraday
