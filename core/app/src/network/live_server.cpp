#include "tickflow/network/live_server.hpp"

#include "tickflow/broadcast/message_codec.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tickflow {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

namespace detail {

// -----------------------------------------------------------------------------
// LiveContext — state shared by the listener and every connection
// -----------------------------------------------------------------------------
// Declaration order matters: ioc is destroyed before the counters and the
// session list, because destroying ioc destroys pending handlers, which
// destroy connection objects that still touch them.
// -----------------------------------------------------------------------------
struct LiveContext {
  LiveContext(const ServerConfig& c, BroadcastHub& h, const ITimeProvider& t)
      : config(c), hub(h), clock(t), acceptor(ioc) {}

  const ServerConfig config;
  BroadcastHub& hub;
  const ITimeProvider& clock;

  std::atomic<std::size_t> active{0};
  std::atomic<bool> stopping{false};  // Set before stop() sweeps sessions

  std::mutex sessions_mutex;
  std::vector<std::weak_ptr<ClientSession>> sessions;

  asio::io_context ioc;
  tcp::acceptor acceptor;

  void track(const std::shared_ptr<ClientSession>& session) {
    std::lock_guard lock(sessions_mutex);
    sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
                                  [](const std::weak_ptr<ClientSession>& w) {
                                    return w.expired();
                                  }),
                   sessions.end());
    sessions.push_back(session);
  }

  std::vector<std::shared_ptr<ClientSession>> live_sessions() {
    std::lock_guard lock(sessions_mutex);
    std::vector<std::shared_ptr<ClientSession>> out;
    for (const auto& weak : sessions) {
      if (auto session = weak.lock()) {
        out.push_back(std::move(session));
      }
    }
    return out;
  }
};

}  // namespace detail

namespace {

constexpr auto kHttpReadTimeout = std::chrono::seconds(30);

std::string path_of(beast::string_view target) {
  std::string path(target.data(), target.size());
  const auto query = path.find('?');
  if (query != std::string::npos) {
    path.erase(query);
  }
  return path;
}

std::string normalize_frame(const std::string& text) {
  std::string out;
  for (unsigned char c : text) {
    if (!std::isspace(c)) {
      out.push_back(static_cast<char>(std::tolower(c)));
    }
  }
  return out;
}

websocket::close_reason close_reason_for(std::optional<CloseReason> reason) {
  if (!reason) {
    return websocket::close_code::normal;
  }
  switch (*reason) {
    case CloseReason::ServerShutdown:
      return websocket::close_code::service_restart;
    case CloseReason::KeepaliveExpired:
      return websocket::close_code::going_away;
    case CloseReason::ClientDisconnect:
      break;
  }
  return websocket::close_code::normal;
}

// -----------------------------------------------------------------------------
// handle_request(): the pull endpoints
// -----------------------------------------------------------------------------
http::response<http::string_body> handle_request(
    detail::LiveContext& ctx, const http::request<http::string_body>& req) {
  http::response<http::string_body> res{http::status::ok, req.version()};
  res.set(http::field::server, "tickflow");
  res.set(http::field::content_type, "application/json");
  res.set(http::field::cache_control, "no-store");
  res.keep_alive(req.keep_alive());

  const std::string path = path_of(req.target());

  if (req.method() != http::verb::get) {
    res.result(http::status::method_not_allowed);
    res.body() = codec::to_wire({{"error", "method not allowed"}});
  } else if (path == "/api/snapshot") {
    res.body() = ctx.hub.snapshotJson();
  } else if (path == "/api/health") {
    res.body() = codec::to_wire(ctx.hub.health());
  } else if (path == "/api/ws_clients") {
    res.body() = codec::to_wire(codec::clients_to_json(ctx.hub.clientCount()));
  } else {
    res.result(http::status::not_found);
    res.body() = codec::to_wire({{"error", "not found"}, {"path", path}});
  }

  res.prepare_payload();
  return res;
}

// -----------------------------------------------------------------------------
// WsSession — one live-channel connection
// -----------------------------------------------------------------------------
class WsSession : public std::enable_shared_from_this<WsSession> {
 public:
  WsSession(tcp::socket&& socket, detail::LiveContext& ctx)
      : ws_(std::move(socket)), ctx_(ctx) {
    ++ctx_.active;
  }

  ~WsSession() { --ctx_.active; }

  void run(http::request<http::string_body> req) {
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res) {
          res.set(http::field::server, "tickflow");
        }));
    ws_.async_accept(req, beast::bind_front_handler(&WsSession::on_accept,
                                                    shared_from_this()));
  }

 private:
  void on_accept(beast::error_code ec) {
    if (ec) {
      std::cerr << "[LiveServer] websocket accept failed: " << ec.message()
                << "\n";
      return;
    }

    session_ = ctx_.hub.connect();
    session_->transition(SessionState::Open);
    ctx_.track(session_);

    std::weak_ptr<WsSession> weak = shared_from_this();
    auto executor = ws_.get_executor();
    session_->set_on_ready([weak, executor] {
      asio::post(executor, [weak] {
        if (auto self = weak.lock()) {
          self->pump();
        }
      });
    });

    // Handshake finished after stop() took its list of sessions: close at
    // once with the shutdown code instead of joining the stream.
    if (ctx_.stopping.load()) {
      session_->begin_close(CloseReason::ServerShutdown);
      ctx_.hub.disconnect(session_->id());
    } else {
      std::cout << "[LiveServer] session " << session_->id()
                << " connected (clients=" << ctx_.hub.clientCount() << ")\n";
    }

    pump();
    do_read();
  }

  // ---------------------------------------------------------------------------
  // Reader task: keepalives only
  // ---------------------------------------------------------------------------
  void do_read() {
    ws_.async_read(buffer_, beast::bind_front_handler(&WsSession::on_read,
                                                      shared_from_this()));
  }

  void on_read(beast::error_code ec, std::size_t /*bytes*/) {
    if (ec) {
      teardown();
      return;
    }

    const std::string text =
        normalize_frame(beast::buffers_to_string(buffer_.data()));
    buffer_.consume(buffer_.size());

    if (text == "ping" || text == "hello") {
      ctx_.hub.touch(session_->id());
      session_->enqueue(std::make_shared<const std::string>(
          codec::encode_pong(ctx_.clock.now_ms())));
    }
    do_read();
  }

  // ---------------------------------------------------------------------------
  // Writer task: one frame in flight at a time
  // ---------------------------------------------------------------------------
  void pump() {
    if (done_ || writing_ || close_sent_) {
      return;
    }
    if (auto next = session_->try_pop()) {
      writing_ = true;
      current_ = std::move(*next);
      ws_.text(true);
      ws_.async_write(asio::buffer(*current_),
                      beast::bind_front_handler(&WsSession::on_write,
                                                shared_from_this()));
      return;
    }
    if (session_->state() == SessionState::Closing) {
      close_sent_ = true;
      ws_.async_close(close_reason_for(session_->close_reason()),
                      beast::bind_front_handler(&WsSession::on_close,
                                                shared_from_this()));
    }
  }

  void on_write(beast::error_code ec, std::size_t /*bytes*/) {
    writing_ = false;
    current_.reset();
    if (ec) {
      teardown();
      return;
    }
    pump();
  }

  void on_close(beast::error_code /*ec*/) { teardown(); }

  // Runs once, whichever side ended the connection first.
  void teardown() {
    if (done_ || !session_) {
      return;
    }
    done_ = true;
    ctx_.hub.disconnect(session_->id());
    session_->begin_close(CloseReason::ClientDisconnect);
    session_->finish_close();

    beast::error_code ignored;
    beast::get_lowest_layer(ws_).socket().shutdown(tcp::socket::shutdown_both,
                                                   ignored);
    std::cout << "[LiveServer] session " << session_->id() << " closed ("
              << to_string(session_->close_reason().value_or(
                     CloseReason::ClientDisconnect))
              << ")\n";
  }

  websocket::stream<beast::tcp_stream> ws_;
  detail::LiveContext& ctx_;
  beast::flat_buffer buffer_;

  std::shared_ptr<ClientSession> session_;
  OutboundMessage current_;
  bool writing_{false};
  bool close_sent_{false};
  bool done_{false};
};

// -----------------------------------------------------------------------------
// HttpSession — plain requests, or hand-off to WsSession on upgrade
// -----------------------------------------------------------------------------
class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(tcp::socket&& socket, detail::LiveContext& ctx)
      : stream_(std::move(socket)), ctx_(ctx) {}

  void run() { do_read(); }

 private:
  void do_read() {
    req_ = {};
    stream_.expires_after(kHttpReadTimeout);
    http::async_read(stream_, buffer_, req_,
                     beast::bind_front_handler(&HttpSession::on_read,
                                               shared_from_this()));
  }

  void on_read(beast::error_code ec, std::size_t /*bytes*/) {
    if (ec == http::error::end_of_stream) {
      do_close();
      return;
    }
    if (ec) {
      return;
    }

    if (websocket::is_upgrade(req_) &&
        path_of(req_.target()) == ctx_.config.ws_path) {
      std::make_shared<WsSession>(stream_.release_socket(), ctx_)
          ->run(std::move(req_));
      return;
    }

    response_ = std::make_shared<http::response<http::string_body>>(
        handle_request(ctx_, req_));
    http::async_write(stream_, *response_,
                      beast::bind_front_handler(&HttpSession::on_write,
                                                shared_from_this(),
                                                response_->need_eof()));
  }

  void on_write(bool close, beast::error_code ec, std::size_t /*bytes*/) {
    if (ec) {
      return;
    }
    if (close) {
      do_close();
      return;
    }
    response_.reset();
    do_read();
  }

  void do_close() {
    beast::error_code ignored;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
  }

  beast::tcp_stream stream_;
  detail::LiveContext& ctx_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  std::shared_ptr<http::response<http::string_body>> response_;
};

void do_accept(detail::LiveContext& ctx) {
  ctx.acceptor.async_accept(
      ctx.ioc, [&ctx](beast::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted || !ctx.acceptor.is_open()) {
          return;
        }
        if (!ec) {
          std::make_shared<HttpSession>(std::move(socket), ctx)->run();
        }
        do_accept(ctx);
      });
}

}  // namespace

// -----------------------------------------------------------------------------
// LiveServer
// -----------------------------------------------------------------------------
LiveServer::LiveServer(ServerConfig config, BroadcastHub& hub,
                       const ITimeProvider& time_provider)
    : config_(std::move(config)), hub_(hub), time_provider_(time_provider) {}

LiveServer::~LiveServer() { stop(); }

void LiveServer::start() {
  if (running_.load()) {
    return;
  }

  auto context =
      std::make_unique<detail::LiveContext>(config_, hub_, time_provider_);

  beast::error_code ec;
  const auto address = asio::ip::make_address(config_.host, ec);
  if (ec) {
    throw std::runtime_error("LiveServer: bad host '" + config_.host +
                             "': " + ec.message());
  }
  const tcp::endpoint endpoint{address, config_.port};

  auto& acceptor = context->acceptor;
  acceptor.open(endpoint.protocol(), ec);
  if (!ec) acceptor.set_option(asio::socket_base::reuse_address(true), ec);
  if (!ec) acceptor.bind(endpoint, ec);
  if (!ec) acceptor.listen(asio::socket_base::max_listen_connections, ec);
  if (ec) {
    throw std::runtime_error("LiveServer: cannot listen on " + config_.host +
                             ":" + std::to_string(config_.port) + ": " +
                             ec.message());
  }
  port_ = acceptor.local_endpoint().port();

  do_accept(*context);
  context_ = std::move(context);
  running_.store(true);

  thread_ = std::thread([ctx = context_.get()] { ctx->ioc.run(); });

  std::cout << "[LiveServer] listening on " << config_.host << ":" << port_
            << " ws=" << config_.ws_path << "\n";
}

// -----------------------------------------------------------------------------
// stop(): stop accepting, close with 1012, bounded wait, stop io
// -----------------------------------------------------------------------------
void LiveServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  detail::LiveContext& ctx = *context_;
  ctx.stopping.store(true);
  asio::post(ctx.ioc, [&ctx] {
    beast::error_code ignored;
    ctx.acceptor.close(ignored);
  });

  const auto sessions = ctx.live_sessions();
  for (const auto& session : sessions) {
    session->begin_close(CloseReason::ServerShutdown);
    hub_.disconnect(session->id());
  }

  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(config_.shutdown_grace_ms);
  while (ctx.active.load() > 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  ctx.ioc.stop();
  if (thread_.joinable()) {
    thread_.join();
  }

  // The io thread is joined, so the tracked list is final. Anything still
  // open leaves the hub here and loses its callback into the dying context.
  for (const auto& session : ctx.live_sessions()) {
    session->set_on_ready({});
    session->begin_close(CloseReason::ServerShutdown);
    hub_.disconnect(session->id());
    session->finish_close();
  }
  context_.reset();

  std::cout << "[LiveServer] stopped.\n";
}

std::size_t LiveServer::active_connections() const {
  return context_ ? context_->active.load() : 0;
}

}  // namespace tickflow
