#include "intraday/market/quote_book.hpp"

#include <mutex>

namespace intraday {

void QuoteBook::update(const std::string& symbol, const Quote& quote) {
  std::unique_lock lock(mutex_);
  quotes_[symbol] = quote;
}

std::optional<Quote> QuoteBook::latestQuote(const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = quotes_.find(symbol);
  if (it == quotes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace intraday
