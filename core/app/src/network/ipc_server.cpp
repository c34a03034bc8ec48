#include "tradeledger/network/ipc_server.hpp"

#include "tradeledger/serialization/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace tradeledger {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
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

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
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

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::publishUpdate(LedgerUpdate update) {
  update_queue_.push(std::move(update));
}

// -----------------------------------------------------------------------------
// run(): alternate between the update feed and the command socket
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processUpdates();
    processCommands();
  }

  // Updates committed just before shutdown still go out.
  processUpdates();
}

void IpcServer::processUpdates() {
  for (const LedgerUpdate& update : update_queue_.drain()) {
    const std::string payload = updateToJson(update).dump();
    zmq::message_t msg(payload.data(), payload.size());
    pub_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one REP round trip, or nothing on timeout
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
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

}  // namespace tradeledger
