#pragma once

#include "intraday/time/time_utils.hpp"

#include <optional>
#include <string>

namespace intraday {

// -----------------------------------------------------------------------------
// Quote — top of book for one symbol
// -----------------------------------------------------------------------------
// Any price may be 0 when the feed did not carry it (e.g. no bid/ask outside
// market hours). Consumers fall back to ltp.
// -----------------------------------------------------------------------------
struct Quote {
  double ltp{0.0};  // Last traded price
  double bid{0.0};  // Best bid
  double ask{0.0};  // Best ask
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// IQuoteSource — read access to the latest quote per symbol
// -----------------------------------------------------------------------------
//
// @details
// PaperTrader prices simulated fills from it; TradingSession injects the
// QuoteBook fed by the MarketDataGateway. Tests inject a QuoteBook they
// fill by hand.
//
// Thread-safety contract: implementations must allow concurrent reads with
// a concurrent writer.
// -----------------------------------------------------------------------------
class IQuoteSource {
 public:
  virtual ~IQuoteSource() = default;

  // Latest quote for symbol, or std::nullopt if none has been seen.
  virtual std::optional<Quote> latestQuote(const std::string& symbol) const = 0;
};

}  // namespace intraday
