#pragma once

#include <cstdint>
#include <string>

namespace intraday {
namespace domain {

// -----------------------------------------------------------------------------
// Instrument — a tradeable contract as configured for the session
// -----------------------------------------------------------------------------
// lot_size is fixed for the instrument's lifetime: every fill on it converts
// lots to units with the same multiplier. product is the broker product code
// (defaults to "INTRADAY").
// -----------------------------------------------------------------------------
struct Instrument {
  std::string symbol;    // Broker symbol (e.g. "NSE:NIFTY24DECFUT")
  std::string exchange;  // Exchange code (e.g. "NSE")
  std::int64_t lot_size{1};
  std::string product{"INTRADAY"};
};

}  // namespace domain
}  // namespace intraday
