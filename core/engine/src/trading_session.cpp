#include "intraday/engine/trading_session.hpp"

#include "intraday/execution/live_trader.hpp"
#include "intraday/execution/paper_trader.hpp"
#include "intraday/serialization/json_codec.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace intraday {

namespace {

const ITimeProvider& selectClock(ClockMode mode, const LiveTimeProvider& live,
                                 const SimulationTimeProvider& sim) {
  if (mode == ClockMode::Replay) {
    return sim;
  }
  return live;
}

std::string describe(const domain::Instrument& inst) {
  std::ostringstream out;
  out << inst.symbol << " (" << inst.exchange << ") [" << inst.product
      << "] - Lot Size: " << inst.lot_size;
  return out.str();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build the ledger and trader; no threads or sockets yet
// -----------------------------------------------------------------------------
TradingSession::TradingSession(AppConfig config, std::size_t instrument_index,
                               IBrokerClient* broker)
    : config_(std::move(config)),
      broker_(broker),
      clock_(selectClock(config_.clock, live_clock_, sim_clock_)) {
  if (instrument_index >= config_.instruments.size()) {
    throw ConfigError("Instrument index " + std::to_string(instrument_index) +
                      " out of range (" +
                      std::to_string(config_.instruments.size()) +
                      " configured)");
  }
  if (config_.mode == TradingMode::Live && broker_ == nullptr) {
    throw ConfigError("Live mode requires a broker client");
  }

  logger_ = std::make_unique<Logger>(clock_, config_.log_file);
  positions_ = std::make_unique<PositionManager>(
      clock_, *logger_, isPaper(), config_.trades_dir);

  const domain::Instrument& instrument = config_.instruments[instrument_index];
  const std::chrono::milliseconds order_interval{config_.min_order_interval_ms};

  if (isPaper()) {
    trader_ = std::make_unique<PaperTrader>(*positions_, quotes_, *logger_,
                                            clock_, instrument,
                                            order_interval);
  } else {
    trader_ = std::make_unique<LiveTrader>(*positions_, *broker_, *logger_,
                                           clock_, instrument, order_interval);
  }

  price_loop_ = std::make_unique<PriceTickLoop>(
      *positions_, *trader_, *logger_,
      std::chrono::milliseconds{config_.price_poll_interval_ms},
      [this] { broadcastState(); });

  logger_->info(std::string("[TradingSession] mode=") +
                toString(config_.mode) +
                " instrument=" + describe(instrument));
}

TradingSession::~TradingSession() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradingSession::start() {
  if (running_) {
    return;
  }

  // ---  1) IPC server (commands + state telemetry) ---------------------------
  if (!config_.ipc_cmd_endpoint.empty() && !config_.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        *logger_, config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
    ipc_server_->start();
  }

  // ---  2) Mark-to-market refresh --------------------------------------------
  if (config_.price_poll_interval_ms > 0) {
    price_loop_->start();
  }

  // ---  3) Market data LAST (quotes begin flowing) ---------------------------
  if (!config_.market_data_endpoint.empty()) {
    SimulationTimeProvider* replay_clock =
        config_.clock == ClockMode::Replay ? &sim_clock_ : nullptr;
    market_data_thread_ = std::make_unique<MarketDataThread>(
        [this](const std::string& symbol, const Quote& quote) {
          quotes_.update(symbol, quote);
        },
        *logger_, replay_clock, config_.market_data_endpoint);
    market_data_thread_->start();
  }

  running_ = true;

  logger_->info(std::string("[TradingSession] started. Threads: ") +
                (ipc_server_ ? "ipc " : "") +
                (config_.price_poll_interval_ms > 0 ? "price_tick " : "") +
                (market_data_thread_ ? "market_data" : ""));
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradingSession::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Stop quote inflow first -------------------------------------------
  market_data_thread_.reset();

  // ---  2) Price loop before IPC: its callback publishes through the server --
  price_loop_->stop();

  // ---  3) IPC last; it may still be answering a command --------------------
  // Join first: a command in flight reads ipc_server_ in broadcastState(),
  // so the pointer is only cleared once the IPC thread is gone.
  if (ipc_server_) {
    ipc_server_->stop();
  }
  ipc_server_.reset();

  running_ = false;

  // ---  4) Paper sessions keep their trades ----------------------------------
  if (isPaper()) {
    ExportResult result = positions_->exportTrades();
    if (result.ok()) {
      logger_->info("[TradingSession] Trades exported: " + result.path);
    }
    std::lock_guard lock(command_mutex_);
    final_export_ = std::move(result);
  }

  logger_->info("[TradingSession] stopped. All threads joined.");
}

// -----------------------------------------------------------------------------
// executeCommand(): operator commands
// -----------------------------------------------------------------------------
std::string TradingSession::executeCommand(const std::string& cmd) {
  std::lock_guard lock(command_mutex_);

  std::istringstream in(cmd);
  std::string verb;
  std::string arg;
  in >> verb >> arg;

  nlohmann::json response;

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (verb == "STATE") {
    response["status"] = "ok";
    response["state"] = stateJson();
  } else if (verb == "TRADES") {
    response["status"] = "ok";
    response["trades"] = toJsonArray(positions_->snapshotTrades());
    response["stats"] = isPaper() ? toJson(positions_->sessionStats())
                                  : nlohmann::json::object();
  } else if (verb == "STATS") {
    response["status"] = "ok";
    response["stats"] = toJson(positions_->sessionStats());
  } else if (auto side = domain::parseSide(verb)) {
    std::istringstream lots_in(arg);
    std::int64_t lots = 0;
    if (arg.empty() || !(lots_in >> lots) || !lots_in.eof()) {
      response = error("Invalid lots: '" + arg + "'");
    } else {
      response = placeOrder(*side, lots);
    }
    broadcastState();
  } else if (verb == "CLOSE_ALL") {
    response = closeAll();
    broadcastState();
  } else if (verb == "INSTRUMENT") {
    response = changeInstrument(arg);
    broadcastState();
  } else if (verb == "EXPORT") {
    response = exportTrades();
  } else {
    response = error("Unknown command: " + cmd);
  }

  return dumpJson(response);
}

// -----------------------------------------------------------------------------
// stateJson(): instrument, position, orders, logs, stats
// -----------------------------------------------------------------------------
nlohmann::json TradingSession::stateJson() const {
  nlohmann::json state;
  state["instrument"] = toJson(trader_->instrument());
  state["position"] = toJson(positions_->snapshotPosition());
  state["order_history"] = toJsonArray(positions_->snapshotOrders());
  state["logs"] = toJsonArray(logger_->entries());
  state["last_update"] = static_cast<double>(clock_.now_ms()) / 1000.0;
  state["paper_mode"] = isPaper();
  if (isPaper()) {
    state["session_stats"] = toJson(positions_->sessionStats());
  }
  return state;
}

std::optional<ExportResult> TradingSession::finalExport() const {
  std::lock_guard lock(command_mutex_);
  return final_export_;
}

// -----------------------------------------------------------------------------
// placeOrder(): forward to the trader, report failures as error responses
// -----------------------------------------------------------------------------
nlohmann::json TradingSession::placeOrder(domain::Side side,
                                          std::int64_t lots) {
  const std::string label = side == domain::Side::Buy ? "Buy" : "Sell";
  std::optional<domain::Order> order;

  try {
    order = trader_->placeOrder(side, lots);
  } catch (const OrderError& e) {
    logger_->error(label + " order failed: " + e.what());
    return error(e.what());
  } catch (const std::invalid_argument& e) {
    logger_->error(label + " order failed: " + e.what());
    return error(e.what());
  }

  nlohmann::json response;
  response["status"] = "ok";
  if (order) {
    response["order"] = toJson(*order);
  } else {
    response["response"] = "Order submitted, fill not confirmed";
  }
  return response;
}

nlohmann::json TradingSession::closeAll() {
  const std::int64_t lots = positions_->openLots();
  if (lots <= 0) {
    logger_->warn("No open positions to close");
    return error("No open positions to close");
  }

  logger_->info("CLOSE ALL command: closing " + std::to_string(lots) +
                " lots");
  return placeOrder(domain::Side::Sell, lots);
}

// -----------------------------------------------------------------------------
// changeInstrument(): only while flat; starts a fresh ledger
// -----------------------------------------------------------------------------
nlohmann::json TradingSession::changeInstrument(const std::string& arg) {
  std::istringstream in(arg);
  std::size_t index = 0;
  if (arg.empty() || arg[0] == '-' || !(in >> index) || !in.eof()) {
    return error("Invalid instrument index: '" + arg + "'");
  }
  if (index >= config_.instruments.size()) {
    return error("Instrument index " + arg + " out of range");
  }

  if (positions_->hasOpenPosition()) {
    logger_->warn("Cannot change instrument with open positions");
    return error("Cannot change instrument with open positions");
  }

  positions_->reset();
  const domain::Instrument& instrument = config_.instruments[index];
  trader_->updateInstrument(instrument);
  logger_->info("Selected instrument: " + describe(instrument));

  nlohmann::json response;
  response["status"] = "ok";
  response["instrument"] = toJson(instrument);
  return response;
}

nlohmann::json TradingSession::exportTrades() {
  ExportResult result = positions_->exportTrades();

  switch (result.status) {
    case ExportStatus::Exported: {
      nlohmann::json response;
      response["status"] = "ok";
      response["response"] = "Trades exported to " + result.path;
      response["filepath"] = result.path;
      return response;
    }
    case ExportStatus::NothingToExport:
      return error("No trades to export");
    case ExportStatus::Failed:
      return error(result.message);
  }
  return error(result.message);
}

void TradingSession::broadcastState() {
  if (!ipc_server_) {
    return;
  }
  nlohmann::json message = stateJson();
  message["type"] = "state";
  ipc_server_->publish(dumpJson(message));
}

nlohmann::json TradingSession::error(const std::string& message) {
  nlohmann::json response;
  response["status"] = "error";
  response["response"] = message;
  return response;
}

}  // namespace intraday
