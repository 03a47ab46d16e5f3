#pragma once
#include "connection/tcp_socket.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace connection {

/**
 * @brief TCP server that serves a single client.
 *
 * Additional clients that connect while one is already being served are
 * rejected (their socket is closed immediately); the current client is not
 * disturbed.
 *
 * The connect callback receives the new connected state and is called once per
 * actual transition, never twice for the same state. It runs on the accept
 * thread (for connects) or on the thread that closed the client.
 *
 * The client socket is handed out as a shared_ptr so a session thread can keep
 * reading from it while close_client() wakes it with shutdown().
 */
class OneClientServer {
public:
  using ConnectCallback = std::function<void(bool connected)>;

  OneClientServer(std::string name, std::string host, uint16_t port,
                  ConnectCallback callback = {});
  ~OneClientServer() noexcept;

  OneClientServer(const OneClientServer&) = delete;
  OneClientServer& operator=(const OneClientServer&) = delete;

  /// Bind, listen and start accepting. False if the port is unavailable or
  /// the server was already started.
  [[nodiscard]] bool start();

  /// Bound port (the ephemeral port if constructed with port 0).
  [[nodiscard]] uint16_t port() const noexcept { return port_.load(); }
  [[nodiscard]] const std::string& host() const noexcept { return host_; }

  [[nodiscard]] bool connected() const;
  [[nodiscard]] std::shared_ptr<TcpSocket> client() const;

  /// Block until a client is connected or the timeout expires.
  [[nodiscard]] bool wait_connected(std::chrono::milliseconds timeout) const;

  /// Drop the current client, if any.
  void close_client();
  /// Drop the current client only if it is still `expected`.
  void close_client(const std::shared_ptr<TcpSocket>& expected);

  /// Stop listening and drop the client. Safe to call more than once.
  void close();

private:
  void accept_loop();
  void adopt(TcpSocket&& sock);
  void call_connect_callback();

  std::string name_;
  std::string host_;
  std::atomic<uint16_t> port_;
  ConnectCallback callback_;

  TcpSocket listener_;
  std::thread accept_thread_;
  std::atomic<bool> started_{false};
  std::atomic<bool> stop_{false};

  mutable std::mutex mtx_;
  mutable std::condition_variable connected_cv_;
  std::shared_ptr<TcpSocket> client_;

  // Serializes connect/disconnect transitions and callback invocations.
  std::mutex cb_mtx_;
  bool last_connected_{false};
};

} // namespace connection
