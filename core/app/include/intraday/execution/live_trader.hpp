#pragma once

#include "intraday/execution/i_broker_client.hpp"
#include "intraday/execution/i_trader.hpp"
#include "intraday/execution/order_throttle.hpp"
#include "intraday/ledger/position_manager.hpp"
#include "intraday/logging/logger.hpp"
#include "intraday/time/i_time_provider.hpp"

#include <chrono>
#include <mutex>
#include <string>

namespace intraday {

// -----------------------------------------------------------------------------
// LiveTrader — broker-backed order execution
// -----------------------------------------------------------------------------
//
// @brief  Submits market orders through an IBrokerClient and applies the
//         confirmed fills to the ledger.
//
// @details
// placeOrder() sequence:
//   1. Validate lots (> 0) and wait for the order throttle.
//   2. Submit a market order for lots * lot_size units.
//      - Rejected ack → OrderError carrying the broker's message.
//      - Transport exception → logged and rethrown.
//   3. Wait fill_check_delay, then fetch the order report.
//   4. If filled_qty > 0 and traded_price > 0: convert units back to lots
//      (integer division by lot_size), record an Order with the broker's
//      status text, apply the fill, and return the Order.
//   5. Otherwise (no report, nothing filled, report fetch failed) log a
//      warning and return std::nullopt. The ledger is not touched.
//
// Broker status codes:
//   1 Cancelled, 2 Traded, 4 Transit, 5 Rejected, 6 Pending, 7 Expired;
//   anything else is "Unknown".
//
// The PositionManager passed in is expected to run with simulation mode
// off: live sessions keep no reconstructed trade history.
//
// Thread model:
//   Same as PaperTrader. The broker client must tolerate calls from the
//   IPC thread (orders) and the price-tick thread (lastPrice) concurrently.
// -----------------------------------------------------------------------------
class LiveTrader final : public ITrader {
 public:
  LiveTrader(PositionManager& positions, IBrokerClient& broker, Logger& logger,
             const ITimeProvider& clock, domain::Instrument instrument,
             std::chrono::milliseconds min_order_interval =
                 std::chrono::milliseconds{100},
             std::chrono::milliseconds fill_check_delay =
                 std::chrono::milliseconds{500});

  LiveTrader(const LiveTrader&) = delete;
  LiveTrader& operator=(const LiveTrader&) = delete;

  std::optional<domain::Order> placeOrder(domain::Side side,
                                          std::int64_t lots) override;

  double fetchCurrentPrice() override;

  void updateInstrument(const domain::Instrument& instrument) override;
  domain::Instrument instrument() const override;

  bool isSimulated() const override { return false; }

  static std::string statusText(int status_code);

 private:
  std::optional<domain::Order> confirmFill(const std::string& order_id,
                                           domain::Side side,
                                           const domain::Instrument& inst);

  PositionManager& positions_;
  IBrokerClient& broker_;
  Logger& logger_;
  const ITimeProvider& clock_;

  mutable std::mutex instrument_mutex_;
  domain::Instrument instrument_;

  OrderThrottle throttle_;
  const std::chrono::milliseconds fill_check_delay_;
};

}  // namespace intraday
