#pragma once

#include "intraday/concurrent/thread_safe_queue.hpp"
#include "intraday/logging/logger.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace intraday {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ command and state-telemetry endpoint
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that answers commands on a REP socket and
//         broadcasts state snapshots on a PUB socket.
//
// @details
// Two sockets share one thread:
//
//   1. REP socket (commands, default port 5556):
//      Each request is a command string ("BUY 2", "STATE", ...). It is
//      passed to command_handler_ (bound to TradingSession::executeCommand)
//      and the returned JSON string is sent back as the reply.
//      ZMQ_RCVTIMEO keeps recv() from blocking so the loop can alternate
//      between commands and telemetry.
//
//   2. PUB socket (telemetry, default port 5557):
//      publish() enqueues a ready-made JSON string; the IPC thread drains
//      the queue and sends each one. Producers never touch the socket.
//
// A handler exception is caught on the IPC thread and answered with
//   {"status":"error","response":"<what()>"}
// so a REP socket is never left without a reply.
//
// Thread model:
//   start()/stop() from the owning thread. publish() from any thread.
//   command_handler_ runs on the IPC thread.
//
// Ownership:
//   Owned by TradingSession via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  IpcServer(CommandHandler command_handler, Logger& logger,
            std::string cmd_endpoint = "tcp://127.0.0.1:5556",
            std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. Idempotent.
  void start();

  // Signals the worker, joins it and closes the sockets. Idempotent.
  void stop();

  // Enqueues a JSON message for the PUB socket. Safe from any thread.
  void publish(std::string message);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  // Runs command_handler_, turning an exception into an error reply.
  std::string dispatch(const std::string& cmd);

  CommandHandler command_handler_;
  Logger& logger_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<std::string> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace intraday
