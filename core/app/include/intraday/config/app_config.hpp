#pragma once

#include "intraday/domain/instrument.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace intraday {

// -----------------------------------------------------------------------------
// ConfigError — raised for unreadable, malformed or invalid configuration
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class TradingMode {
  Paper,  // Simulated fills, trade reconstruction enabled
  Live,   // Broker fills, no trade reconstruction
};

enum class ClockMode {
  Wall,    // LiveTimeProvider
  Replay,  // SimulationTimeProvider advanced by the market data feed
};

// -----------------------------------------------------------------------------
// AppConfig — session configuration loaded from config.json
// -----------------------------------------------------------------------------
//
// @brief  Everything a TradingSession needs to start: trading mode, clock,
//         configured instruments, file locations, ZeroMQ endpoints and
//         polling cadence.
//
// @details
// Expected JSON (only "instruments" is required):
//
//   {
//     "mode": "paper",
//     "clock": "wall",
//     "instruments": [
//       {"symbol": "NSE:NIFTY24DECFUT", "exchange": "NSE", "lot_size": 25,
//        "product": "INTRADAY"}
//     ],
//     "log_file": "trading.log",
//     "trades_dir": "trades",
//     "market_data_endpoint": "tcp://127.0.0.1:5555",
//     "ipc_cmd_endpoint": "tcp://127.0.0.1:5556",
//     "ipc_pub_endpoint": "tcp://127.0.0.1:5557",
//     "price_poll_interval_ms": 5000,
//     "min_order_interval_ms": 100
//   }
//
// An empty endpoint string disables the corresponding network component.
//
// Validation errors throw ConfigError with a message naming the offending
// field (instruments are numbered from 1, as an operator reads the file).
//
// Thread model:
//   Plain value type, copied into the session at construction.
// -----------------------------------------------------------------------------
struct AppConfig {
  TradingMode mode{TradingMode::Paper};
  ClockMode clock{ClockMode::Wall};
  std::vector<domain::Instrument> instruments;

  std::string log_file{"trading.log"};
  std::string trades_dir{"trades"};

  std::string market_data_endpoint{"tcp://127.0.0.1:5555"};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};

  int price_poll_interval_ms{5000};
  int min_order_interval_ms{100};

  // Reads and parses filename. Throws ConfigError.
  static AppConfig load(const std::string& filename);

  // Parses a JSON document. Throws ConfigError.
  static AppConfig parse(const std::string& json_text);
};

const char* toString(TradingMode mode);

}  // namespace intraday
