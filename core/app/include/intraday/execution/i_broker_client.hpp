#pragma once

#include "intraday/domain/order.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace intraday {

// Market order as submitted to the broker. quantity is in UNITS.
struct MarketOrderRequest {
  std::string symbol;
  std::int64_t quantity{0};
  domain::Side side{domain::Side::Buy};
  std::string product{"INTRADAY"};
};

// Broker acknowledgment of a submission.
struct BrokerOrderAck {
  bool accepted{false};
  std::string order_id;
  std::string message;  // Rejection reason when !accepted
};

// Execution state of a submitted order, as found in the broker's order book.
struct BrokerOrderReport {
  std::string order_id;
  std::int64_t filled_qty{0};  // Units
  double traded_price{0.0};    // Average fill price
  int status_code{0};          // Broker status code, see LiveTrader::statusText
};

// -----------------------------------------------------------------------------
// IBrokerClient — boundary to a broker's order API
// -----------------------------------------------------------------------------
//
// @details
// LiveTrader's only dependency on the outside world. Implementations own the
// network protocol, authentication and any retry policy; none of that ships
// with this project. Methods may throw std::exception subclasses on
// transport failure; LiveTrader handles them per call (see live_trader.hpp).
// -----------------------------------------------------------------------------
class IBrokerClient {
 public:
  virtual ~IBrokerClient() = default;

  virtual BrokerOrderAck placeMarketOrder(const MarketOrderRequest& request) = 0;

  // Report for order_id, std::nullopt if the broker does not list it.
  virtual std::optional<BrokerOrderReport> orderReport(
      const std::string& order_id) = 0;

  // Last traded price, 0 when unavailable.
  virtual double lastPrice(const std::string& symbol) = 0;
};

}  // namespace intraday
