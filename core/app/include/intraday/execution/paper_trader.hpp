#pragma once

#include "intraday/concurrent/order_id_generator.hpp"
#include "intraday/execution/i_trader.hpp"
#include "intraday/execution/order_throttle.hpp"
#include "intraday/ledger/position_manager.hpp"
#include "intraday/logging/logger.hpp"
#include "intraday/market/i_quote_source.hpp"
#include "intraday/time/i_time_provider.hpp"

#include <chrono>
#include <mutex>
#include <string>

namespace intraday {

// -----------------------------------------------------------------------------
// PaperTrader — simulated order execution against live quotes
// -----------------------------------------------------------------------------
//
// @brief  Fills every order immediately at the current top of book and
//         applies it to the ledger.
//
// @details
// Fill price selection:
//   BUY  → best ask (what sellers offer), else last traded price.
//   SELL → best bid (what buyers pay),    else last traded price.
// No quote for the symbol, or no positive price on the chosen side and no
// positive ltp, throws OrderError and leaves the ledger untouched.
//
// Every fill is recorded as an Order with id "PAPER" + six-digit sequence
// and status "Paper Executed", then applied with applyFill(). The
// PositionManager passed in is expected to run in simulation mode so closed
// trades are reconstructed.
//
// Thread model:
//   placeOrder() may run concurrently from several IPC command threads. The
//   instrument is guarded by instrument_mutex_; fills are serialized by the
//   PositionManager's own lock.
//
// Ownership:
//   Holds references to the PositionManager, quote source, logger and clock;
//   all are owned by TradingSession and outlive the trader.
// -----------------------------------------------------------------------------
class PaperTrader final : public ITrader {
 public:
  PaperTrader(PositionManager& positions, const IQuoteSource& quotes,
              Logger& logger, const ITimeProvider& clock,
              domain::Instrument instrument,
              std::chrono::milliseconds min_order_interval =
                  std::chrono::milliseconds{100});

  PaperTrader(const PaperTrader&) = delete;
  PaperTrader& operator=(const PaperTrader&) = delete;

  std::optional<domain::Order> placeOrder(domain::Side side,
                                          std::int64_t lots) override;

  double fetchCurrentPrice() override;

  void updateInstrument(const domain::Instrument& instrument) override;
  domain::Instrument instrument() const override;

  bool isSimulated() const override { return true; }

 private:
  // Picks the execution price for side from the latest quote.
  double executionPrice(domain::Side side, const std::string& symbol) const;

  PositionManager& positions_;
  const IQuoteSource& quotes_;
  Logger& logger_;
  const ITimeProvider& clock_;

  mutable std::mutex instrument_mutex_;
  domain::Instrument instrument_;

  OrderThrottle throttle_;
  OrderIdGenerator order_ids_;
};

}  // namespace intraday
