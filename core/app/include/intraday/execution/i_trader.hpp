#pragma once

#include "intraday/domain/instrument.hpp"
#include "intraday/domain/order.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>

namespace intraday {

// -----------------------------------------------------------------------------
// OrderError — an order could not be executed
// -----------------------------------------------------------------------------
// Thrown when no execution price is available (paper) or the broker rejects
// the order (live). The ledger is untouched when it is thrown.
// -----------------------------------------------------------------------------
class OrderError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// ITrader — order-execution capability
// -----------------------------------------------------------------------------
//
// @brief  Turns an operator's "buy/sell N lots" into an executed fill and
//         applies it to the PositionManager.
//
// @details
// Two variants, chosen once when the TradingSession is built:
//
//   PaperTrader → fills simulated against the latest quote (ask for BUY,
//                 bid for SELL, last price as fallback).
//   LiveTrader  → fills reported by a broker through IBrokerClient.
//
// Callers (TradingSession command handlers, PriceTickLoop) depend only on
// this interface, so they behave identically in both modes. The
// PositionManager never knows which variant fed it.
//
// Contract shared by both variants:
//   - lots <= 0 → std::invalid_argument, nothing recorded.
//   - Orders are spaced by a minimum interval (sleeping if needed).
//   - On success the fill is recorded with recordOrder() and then applied
//     with applyFill(), and the recorded Order is returned.
//   - std::nullopt means the order was sent but no fill could be confirmed.
//
// Thread model:
//   placeOrder() may be called from several threads (IPC commands); the
//   instrument is read and replaced under an internal lock.
// -----------------------------------------------------------------------------
class ITrader {
 public:
  virtual ~ITrader() = default;

  // @throws std::invalid_argument for lots <= 0, OrderError on execution
  //         failure.
  virtual std::optional<domain::Order> placeOrder(domain::Side side,
                                                  std::int64_t lots) = 0;

  // Current market price of the active instrument, 0 when unknown.
  virtual double fetchCurrentPrice() = 0;

  virtual void updateInstrument(const domain::Instrument& instrument) = 0;
  virtual domain::Instrument instrument() const = 0;

  virtual bool isSimulated() const = 0;
};

}  // namespace intraday
