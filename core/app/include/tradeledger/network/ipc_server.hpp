#pragma once

#include "tradeledger/concurrent/thread_safe_queue.hpp"
#include "tradeledger/events/ledger_update.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace tradeledger {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command and update-feed gateway
// -----------------------------------------------------------------------------
//
// @brief  Runs one worker thread serving JSON commands on a REP socket and
//         broadcasting committed ledger updates on a PUB socket.
//
// @details
//   1. REP socket (default tcp://127.0.0.1:5556):
//      Each request is a JSON command string handed to command_handler_
//      (bound to LifecycleEngine::executeCommand()); the returned JSON is
//      sent back. ZMQ_RCVTIMEO keeps recv() from blocking so the worker
//      alternates between commands and the update feed.
//
//   2. PUB socket (default tcp://127.0.0.1:5557):
//      Publishes every LedgerUpdate pushed through publishUpdate(), one JSON
//      object per message, in sequence_id order.
//
// Thread model:
//   start() / stop() on the owning thread. publishUpdate() from any thread,
//   typically the thread that committed a ledger write. command_handler_
//   runs on the IPC worker and must be thread-safe.
//
// Ownership:
//   Owned by LifecycleEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the update queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op when running.
  // Throws zmq::error_t if an endpoint cannot be bound.
  void start();

  // Stops the worker within kPollTimeoutMs, publishes what is still queued,
  // and closes the sockets. Idempotent.
  void stop();

  bool isRunning() const { return running_.load(); }

  // Enqueues a committed update for the PUB socket.
  void publishUpdate(LedgerUpdate update);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processUpdates();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<LedgerUpdate> update_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace tradeledger
