#include "intraday/config/app_config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace intraday {

namespace {

std::string instrumentLabel(std::size_t index) {
  return "Instrument " + std::to_string(index + 1);
}

domain::Instrument parseInstrument(const nlohmann::json& j, std::size_t index) {
  if (!j.is_object()) {
    throw ConfigError(instrumentLabel(index) + ": must be an object");
  }

  domain::Instrument inst;
  inst.symbol = j.value("symbol", std::string{});
  inst.exchange = j.value("exchange", std::string{});
  inst.lot_size = j.value("lot_size", std::int64_t{0});
  inst.product = j.value("product", std::string{});

  if (inst.symbol.empty()) {
    throw ConfigError(instrumentLabel(index) + ": symbol is required");
  }
  if (inst.exchange.empty()) {
    throw ConfigError(instrumentLabel(index) + ": exchange is required");
  }
  if (inst.lot_size <= 0) {
    throw ConfigError(instrumentLabel(index) +
                      ": lot_size must be greater than 0");
  }
  if (inst.product.empty()) {
    inst.product = "INTRADAY";
  }
  return inst;
}

int nonNegativeInt(const nlohmann::json& j, const char* key, int fallback) {
  int value = j.value(key, fallback);
  if (value < 0) {
    throw ConfigError(std::string(key) + " must not be negative");
  }
  return value;
}

}  // namespace

const char* toString(TradingMode mode) {
  switch (mode) {
    case TradingMode::Paper: return "paper";
    case TradingMode::Live:  return "live";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// load(): read the file, then parse
// -----------------------------------------------------------------------------
AppConfig AppConfig::load(const std::string& filename) {
  std::ifstream in(filename);
  if (!in.is_open()) {
    throw ConfigError("Configuration file " + filename + " not found");
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  return parse(buffer.str());
}

// -----------------------------------------------------------------------------
// parse(): decode JSON and validate
// -----------------------------------------------------------------------------
AppConfig AppConfig::parse(const std::string& json_text) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(std::string("Error decoding configuration: ") + e.what());
  }

  if (!doc.is_object()) {
    throw ConfigError("Configuration root must be a JSON object");
  }

  AppConfig cfg;

  try {
    std::string mode = doc.value("mode", std::string{"paper"});
    if (mode == "paper") {
      cfg.mode = TradingMode::Paper;
    } else if (mode == "live") {
      cfg.mode = TradingMode::Live;
    } else {
      throw ConfigError("mode must be \"paper\" or \"live\", got \"" + mode +
                        "\"");
    }

    std::string clock = doc.value("clock", std::string{"wall"});
    if (clock == "wall") {
      cfg.clock = ClockMode::Wall;
    } else if (clock == "replay") {
      cfg.clock = ClockMode::Replay;
    } else {
      throw ConfigError("clock must be \"wall\" or \"replay\", got \"" + clock +
                        "\"");
    }

    auto it = doc.find("instruments");
    if (it == doc.end() || !it->is_array() || it->empty()) {
      throw ConfigError("At least one instrument is required in config");
    }
    for (std::size_t i = 0; i < it->size(); ++i) {
      cfg.instruments.push_back(parseInstrument((*it)[i], i));
    }

    cfg.log_file = doc.value("log_file", cfg.log_file);
    cfg.trades_dir = doc.value("trades_dir", cfg.trades_dir);
    cfg.market_data_endpoint =
        doc.value("market_data_endpoint", cfg.market_data_endpoint);
    cfg.ipc_cmd_endpoint = doc.value("ipc_cmd_endpoint", cfg.ipc_cmd_endpoint);
    cfg.ipc_pub_endpoint = doc.value("ipc_pub_endpoint", cfg.ipc_pub_endpoint);

    cfg.price_poll_interval_ms =
        nonNegativeInt(doc, "price_poll_interval_ms", cfg.price_poll_interval_ms);
    cfg.min_order_interval_ms =
        nonNegativeInt(doc, "min_order_interval_ms", cfg.min_order_interval_ms);
  } catch (const nlohmann::json::type_error& e) {
    // value() throws type_error when a key holds the wrong JSON type.
    throw ConfigError(std::string("Invalid configuration value: ") + e.what());
  }

  return cfg;
}

}  // namespace intraday
