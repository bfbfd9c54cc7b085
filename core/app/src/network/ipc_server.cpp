#include "tickflow/network/ipc_server.hpp"

#include <iostream>
#include <utility>

namespace tickflow {

IpcServer::IpcServer(CommandHandler command_handler, BroadcastHub& hub,
                     IpcConfig config)
    : command_handler_(std::move(command_handler)),
      hub_(hub),
      config_(std::move(config)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets, open the feed session, spawn worker thread
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
  cmd_socket_->bind(config_.cmd_endpoint);
  pub_socket_->bind(config_.pub_endpoint);

  openSession();
  running_.store(true);

  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << config_.cmd_endpoint
            << " PUB=" << config_.pub_endpoint << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  if (session_) {
    hub_.disconnect(session_->id());
    session_->finish_close();
    session_.reset();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped. published=" << published_.load() << "\n";
}

void IpcServer::openSession() {
  session_ = hub_.connect();
  session_->transition(SessionState::Open);
}

// -----------------------------------------------------------------------------
// run(): combined drain/poll loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processFeed();
    processCommands();
  }

  // Final drain: publish what the hub queued before shutdown.
  processFeed();
}

// -----------------------------------------------------------------------------
// processFeed(): keep the hub session alive and forward its queue to PUB
// -----------------------------------------------------------------------------
void IpcServer::processFeed() {
  if (!session_) {
    return;
  }

  const auto state = session_->state();
  if (state == SessionState::Open) {
    hub_.touch(session_->id());
  }

  while (auto message = session_->try_pop()) {
    zmq::message_t msg((*message)->data(), (*message)->size());
    if (pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      ++published_;
    }
  }

  if (state == SessionState::Closing && running_.load()) {
    std::cerr << "[IpcServer] feed session " << session_->id() << " closed ("
              << to_string(session_->close_reason().value_or(
                     CloseReason::ClientDisconnect))
              << "), reopening\n";
    session_->finish_close();
    openSession();
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
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

}  // namespace tickflow
