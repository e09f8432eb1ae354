#include "intraday/execution/live_trader.hpp"

#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace intraday {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
LiveTrader::LiveTrader(PositionManager& positions, IBrokerClient& broker,
                       Logger& logger, const ITimeProvider& clock,
                       domain::Instrument instrument,
                       std::chrono::milliseconds min_order_interval,
                       std::chrono::milliseconds fill_check_delay)
    : positions_(positions),
      broker_(broker),
      logger_(logger),
      clock_(clock),
      instrument_(std::move(instrument)),
      throttle_(min_order_interval),
      fill_check_delay_(fill_check_delay) {}

// -----------------------------------------------------------------------------
// placeOrder: submit, then confirm the fill from the broker's order book
// -----------------------------------------------------------------------------
std::optional<domain::Order> LiveTrader::placeOrder(domain::Side side,
                                                    std::int64_t lots) {
  if (lots <= 0) {
    logger_.error("[LiveTrader] Invalid lots quantity: " +
                  std::to_string(lots));
    throw std::invalid_argument("Lots must be greater than 0");
  }

  throttle_.acquire();

  const domain::Instrument inst = instrument();

  MarketOrderRequest request;
  request.symbol = inst.symbol;
  request.quantity = lots * inst.lot_size;
  request.side = side;
  request.product = inst.product;

  {
    std::ostringstream msg;
    msg << "[LiveTrader] Placing " << domain::toString(side) << " order for "
        << lots << " lots (" << request.quantity << " units) of "
        << inst.symbol;
    logger_.info(msg.str());
  }

  BrokerOrderAck ack;
  try {
    ack = broker_.placeMarketOrder(request);
  } catch (const std::exception& e) {
    logger_.error(std::string("[LiveTrader] Order placement exception: ") +
                  e.what());
    throw;
  }

  if (!ack.accepted) {
    std::string reason = ack.message.empty() ? "Unknown error" : ack.message;
    logger_.error("[LiveTrader] Order placement failed: " + reason);
    throw OrderError("Order failed: " + reason);
  }

  logger_.info("[LiveTrader] Order placed successfully! Order ID: " +
               ack.order_id);

  if (fill_check_delay_.count() > 0) {
    std::this_thread::sleep_for(fill_check_delay_);
  }

  return confirmFill(ack.order_id, side, inst);
}

// -----------------------------------------------------------------------------
// confirmFill: look the order up and apply what was filled
// -----------------------------------------------------------------------------
std::optional<domain::Order> LiveTrader::confirmFill(
    const std::string& order_id, domain::Side side,
    const domain::Instrument& inst) {
  std::optional<BrokerOrderReport> report;
  try {
    report = broker_.orderReport(order_id);
  } catch (const std::exception& e) {
    logger_.warn(std::string("[LiveTrader] Could not fetch order details: ") +
                 e.what());
    return std::nullopt;
  }

  if (!report || report->filled_qty <= 0 || report->traded_price <= 0.0) {
    logger_.warn("[LiveTrader] No fill confirmed yet for order " + order_id);
    return std::nullopt;
  }

  const std::int64_t filled_lots = report->filled_qty / inst.lot_size;

  domain::Order order;
  order.timestamp = ms_to_timestamp(clock_.now_ms());
  order.side = side;
  order.quantity = filled_lots;
  order.price = report->traded_price;
  order.order_id = order_id;
  order.status = statusText(report->status_code);

  positions_.recordOrder(order);
  positions_.applyFill(side, filled_lots, report->traded_price, inst.lot_size);

  std::ostringstream msg;
  msg.setf(std::ios::fixed);
  msg.precision(2);
  msg << "[LiveTrader] Order executed: " << filled_lots << " lots @ "
      << report->traded_price;
  logger_.info(msg.str());

  return order;
}

// -----------------------------------------------------------------------------
// fetchCurrentPrice: broker's last traded price
// -----------------------------------------------------------------------------
double LiveTrader::fetchCurrentPrice() {
  try {
    double price = broker_.lastPrice(instrument().symbol);
    return price > 0.0 ? price : 0.0;
  } catch (const std::exception& e) {
    logger_.debug(std::string("[LiveTrader] Price fetch failed: ") + e.what());
    return 0.0;
  }
}

void LiveTrader::updateInstrument(const domain::Instrument& instrument) {
  {
    std::lock_guard lock(instrument_mutex_);
    instrument_ = instrument;
  }
  logger_.info("[LiveTrader] Instrument updated to: " + instrument.symbol +
               " (" + instrument.exchange + ") [" + instrument.product + "]");
}

domain::Instrument LiveTrader::instrument() const {
  std::lock_guard lock(instrument_mutex_);
  return instrument_;
}

// -----------------------------------------------------------------------------
// statusText: broker status code → display text
// -----------------------------------------------------------------------------
std::string LiveTrader::statusText(int status_code) {
  switch (status_code) {
    case 1: return "Cancelled";
    case 2: return "Traded";
    case 4: return "Transit";
    case 5: return "Rejected";
    case 6: return "Pending";
    case 7: return "Expired";
    default: return "Unknown";
  }
}

}  // namespace intraday
