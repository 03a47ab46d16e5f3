#include "connection/one_client_server.hpp"

#include "utils/logger.hpp"

#include <exception>
#include <utility>

namespace connection {

static constexpr std::chrono::milliseconds kAcceptPoll{50};

OneClientServer::OneClientServer(std::string name, std::string host, uint16_t port,
                                 ConnectCallback callback)
  : name_(std::move(name)), host_(std::move(host)), port_(port), callback_(std::move(callback)) {}

OneClientServer::~OneClientServer() noexcept {
  close();
}

bool OneClientServer::start() {
  if (started_.exchange(true)) {
    logger::error() << "[SERVER] " << name_ << ": start called more than once\n";
    return false;
  }

  if (!listener_.bind_listen(host_, port_.load(), 4)) {
    logger::error() << "[SERVER] " << name_ << ": failed to bind " << host_ << ":" << port_.load() << "\n";
    listener_.close();
    return false;
  }
  port_.store(listener_.local_port());

  accept_thread_ = std::thread([this] { accept_loop(); });
  logger::info() << "[SERVER] " << name_ << ": listening on " << host_ << ":" << port_.load() << "\n";
  return true;
}

bool OneClientServer::connected() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return client_ != nullptr && client_->is_open();
}

std::shared_ptr<TcpSocket> OneClientServer::client() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return client_;
}

bool OneClientServer::wait_connected(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lk(mtx_);
  return connected_cv_.wait_for(lk, timeout, [this] { return client_ != nullptr; });
}

void OneClientServer::accept_loop() {
  while (!stop_.load()) {
    const auto r = listener_.wait_readable(kAcceptPoll);
    if (r == WaitResult::Timeout) continue;
    if (r == WaitResult::Error) {
      logger::error() << "[SERVER] " << name_ << ": listener failed; no longer accepting\n";
      break;
    }

    TcpSocket c;
    if (!listener_.accept_client(c, false)) continue;
    if (!c.set_nodelay(true)) {
      logger::debug() << "[SERVER] " << name_ << ": TCP_NODELAY not set\n";
    }
    adopt(std::move(c));
  }
}

void OneClientServer::adopt(TcpSocket&& sock) {
  std::lock_guard<std::mutex> cb(cb_mtx_);
  if (connected()) {
    logger::error() << "[SERVER] " << name_ << ": rejecting connection; a client is already connected\n";
    sock.close();
    return;
  }
  {
    std::lock_guard<std::mutex> lk(mtx_);
    client_ = std::make_shared<TcpSocket>(std::move(sock));
  }
  connected_cv_.notify_all();
  logger::info() << "[SERVER] " << name_ << ": client connected\n";
  call_connect_callback();
}

void OneClientServer::close_client() {
  close_client(nullptr);
}

void OneClientServer::close_client(const std::shared_ptr<TcpSocket>& expected) {
  std::lock_guard<std::mutex> cb(cb_mtx_);
  std::shared_ptr<TcpSocket> old;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (expected && client_ != expected) return;
    old = std::exchange(client_, nullptr);
  }
  if (old) {
    // Other holders (a session thread) still own the fd; shutdown wakes them.
    old->shutdown();
    logger::info() << "[SERVER] " << name_ << ": client closed\n";
  }
  call_connect_callback();
}

void OneClientServer::close() {
  stop_.store(true);
  if (accept_thread_.joinable()) {
    accept_thread_.join();
    logger::info() << "[SERVER] " << name_ << ": closed\n";
  }
  listener_.close();
  close_client();
}

void OneClientServer::call_connect_callback() {
  const bool now = connected();
  if (now == last_connected_) return;
  last_connected_ = now;
  if (!callback_) return;
  try {
    callback_(now);
  } catch (const std::exception& e) {
    logger::error() << "[SERVER] " << name_ << ": connect callback failed: " << e.what() << "\n";
  }
}

} // namespace connection
