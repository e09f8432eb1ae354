#pragma once

#include "intraday/market/i_quote_source.hpp"

#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace intraday {

// -----------------------------------------------------------------------------
// QuoteBook — latest quote per symbol
// -----------------------------------------------------------------------------
//
// @brief  Thread-safe map symbol → Quote. The market data thread writes,
//         the trader and price-tick threads read.
//
// @details
// Writers (update) take a unique_lock; readers (latestQuote) take a
// shared_lock so concurrent readers do not contend with each other. Each
// update replaces the previous quote for the symbol wholesale.
// -----------------------------------------------------------------------------
class QuoteBook final : public IQuoteSource {
 public:
  QuoteBook() = default;

  QuoteBook(const QuoteBook&) = delete;
  QuoteBook& operator=(const QuoteBook&) = delete;

  void update(const std::string& symbol, const Quote& quote);

  std::optional<Quote> latestQuote(const std::string& symbol) const override;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Quote> quotes_;
};

}  // namespace intraday
