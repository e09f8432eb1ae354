#include "intraday/network/ipc_server.hpp"

#include "intraday/serialization/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <utility>

namespace intraday {

IpcServer::IpcServer(CommandHandler command_handler, Logger& logger,
                     std::string cmd_endpoint, std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      logger_(logger),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);

  thread_ = std::thread([this] { run(); });

  logger_.info("[IpcServer] started. CMD=" + cmd_endpoint_ +
               " PUB=" + pub_endpoint_);
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  logger_.info("[IpcServer] stopped.");
}

void IpcServer::publish(std::string message) {
  telemetry_queue_.push(std::move(message));
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  // Final drain so the last state snapshot goes out before shutdown.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto message = telemetry_queue_.try_pop()) {
    zmq::message_t msg(message->data(), message->size());
    pub_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = dispatch(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

std::string IpcServer::dispatch(const std::string& cmd) {
  try {
    return command_handler_(cmd);
  } catch (const std::exception& e) {
    logger_.error("[IpcServer] command '" + cmd + "' failed: " + e.what());
    nlohmann::json response;
    response["status"] = "error";
    response["response"] = e.what();
    return dumpJson(response);
  }
}

}  // namespace intraday
