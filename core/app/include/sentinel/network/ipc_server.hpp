#pragma once

#include "sentinel/concurrent/thread_safe_queue.hpp"
#include "sentinel/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace sentinel {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ operator gateway
// -----------------------------------------------------------------------------
//
// @brief  Serves operator commands on a REP socket and broadcasts lifecycle
//         telemetry on a PUB socket, both from one worker thread.
//
// @details
// REP socket (default tcp://127.0.0.1:5556):
//   Each request is a JSON command string, handed to command_handler_
//   (bound to SentinelEngine::executeCommand). The handler's JSON reply is
//   sent back verbatim. ZMQ_RCVTIMEO keeps the loop from blocking so it can
//   alternate with telemetry draining.
//
// PUB socket (default tcp://127.0.0.1:5557):
//   Every Event pushed through pushTelemetry() is encoded by eventToJson()
//   and published. The telemetry queue is bounded and drops the oldest
//   message when no one drains it fast enough.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread
//   (in practice the notifier worker). The command handler runs on the IPC
//   worker thread.
//
// Ownership:
//   Owned by SentinelEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557",
                     std::size_t telemetry_capacity = 4096);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. Idempotent. zmq::error_t from
  // bind propagates.
  void start();

  // Signals the worker, joins it, closes the sockets. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  bool running() const { return running_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace sentinel
