#include "intraday/domain/order.hpp"

namespace intraday {
namespace domain {

// -----------------------------------------------------------------------------
// toString(Side)
// -----------------------------------------------------------------------------
const char* toString(Side side) {
  switch (side) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// parseSide(): wire spelling → Side
// -----------------------------------------------------------------------------
std::optional<Side> parseSide(const std::string& text) {
  if (text == "BUY") {
    return Side::Buy;
  }
  if (text == "SELL") {
    return Side::Sell;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace intraday
