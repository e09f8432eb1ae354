#include "intraday/execution/paper_trader.hpp"

#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace intraday {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
PaperTrader::PaperTrader(PositionManager& positions,
                         const IQuoteSource& quotes, Logger& logger,
                         const ITimeProvider& clock,
                         domain::Instrument instrument,
                         std::chrono::milliseconds min_order_interval)
    : positions_(positions),
      quotes_(quotes),
      logger_(logger),
      clock_(clock),
      instrument_(std::move(instrument)),
      throttle_(min_order_interval) {}

// -----------------------------------------------------------------------------
// placeOrder: validate, price from the book, record, apply
// -----------------------------------------------------------------------------
std::optional<domain::Order> PaperTrader::placeOrder(domain::Side side,
                                                     std::int64_t lots) {
  if (lots <= 0) {
    logger_.error("[PaperTrader] Invalid lots quantity: " +
                  std::to_string(lots));
    throw std::invalid_argument("Lots must be greater than 0");
  }

  throttle_.acquire();

  const domain::Instrument inst = instrument();
  const std::int64_t units = lots * inst.lot_size;

  {
    std::ostringstream msg;
    msg << "[PaperTrader] Placing " << domain::toString(side) << " order for "
        << lots << " lots (" << units << " units) of " << inst.symbol;
    logger_.info(msg.str());
  }

  double price = 0.0;
  try {
    price = executionPrice(side, inst.symbol);
  } catch (const OrderError& e) {
    logger_.error(std::string("[PaperTrader] Order execution failed: ") +
                  e.what());
    throw;
  }

  char id_buf[32];
  std::snprintf(id_buf, sizeof(id_buf), "PAPER%06llu",
                static_cast<unsigned long long>(order_ids_.next_id()));

  domain::Order order;
  order.timestamp = ms_to_timestamp(clock_.now_ms());
  order.side = side;
  order.quantity = lots;
  order.price = price;
  order.order_id = id_buf;
  order.status = "Paper Executed";

  {
    std::ostringstream msg;
    msg.setf(std::ios::fixed);
    msg.precision(2);
    msg << "[PaperTrader] Order executed: " << lots << " lots @ " << price
        << " (Order ID: " << order.order_id << ")";
    logger_.info(msg.str());
  }

  positions_.recordOrder(order);
  positions_.applyFill(side, lots, price, inst.lot_size);
  return order;
}

// -----------------------------------------------------------------------------
// executionPrice: ask/bid with ltp fallback
// -----------------------------------------------------------------------------
double PaperTrader::executionPrice(domain::Side side,
                                   const std::string& symbol) const {
  std::optional<Quote> quote = quotes_.latestQuote(symbol);
  if (!quote) {
    throw OrderError("No market depth data available for " + symbol);
  }

  double price = (side == domain::Side::Buy) ? quote->ask : quote->bid;
  if (price <= 0.0) {
    price = quote->ltp;
  }

  if (price <= 0.0) {
    throw OrderError(std::string("Could not determine execution price - no ") +
                     (side == domain::Side::Buy ? "ASK" : "BID") +
                     " or LTP available");
  }
  return price;
}

// -----------------------------------------------------------------------------
// fetchCurrentPrice: last traded price from the book
// -----------------------------------------------------------------------------
double PaperTrader::fetchCurrentPrice() {
  std::optional<Quote> quote = quotes_.latestQuote(instrument().symbol);
  if (!quote || quote->ltp <= 0.0) {
    return 0.0;
  }
  return quote->ltp;
}

void PaperTrader::updateInstrument(const domain::Instrument& instrument) {
  {
    std::lock_guard lock(instrument_mutex_);
    instrument_ = instrument;
  }
  logger_.info("[PaperTrader] Instrument updated to: " + instrument.symbol +
               " (" + instrument.exchange + ") [" + instrument.product + "]");
}

domain::Instrument PaperTrader::instrument() const {
  std::lock_guard lock(instrument_mutex_);
  return instrument_;
}

}  // namespace intraday
