#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <netinet/in.h>

namespace connection
{

  // Result of a bounded wait on a socket.
  enum class WaitResult
  {
    Ready,
    Timeout,
    Error
  };

  class TcpSocket
  {
  public:
    TcpSocket();
    ~TcpSocket() noexcept;

    TcpSocket(const TcpSocket &) = delete;
    TcpSocket &operator=(const TcpSocket &) = delete;
    TcpSocket(TcpSocket &&) noexcept;
    TcpSocket &operator=(TcpSocket &&) noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

    /// Blocking connect bounded by `timeout`; the socket is left in blocking mode.
    [[nodiscard]] bool connect_with_timeout(std::string_view ip, uint16_t port,
                                            std::chrono::milliseconds timeout);
    [[nodiscard]] bool bind_listen(std::string_view local_addr, uint16_t local_port, int backlog = 1);
    [[nodiscard]] bool accept_client(TcpSocket &out, bool nonblocking = false);
    [[nodiscard]] bool set_nodelay(bool on = true);

    /// Port this socket is bound to (resolves port 0 after bind); 0 on error.
    [[nodiscard]] uint16_t local_port() const noexcept;

    [[nodiscard]] WaitResult wait_readable(std::chrono::milliseconds timeout) const;

    [[nodiscard]] bool send_all(const void *data, size_t len) const;
    [[nodiscard]] bool recv_all(void *data, size_t len) const;
    [[nodiscard]] bool try_recv(void *data, size_t len, size_t &out_nbytes) const;

    /// Wake any thread blocked in recv/send on this socket. The fd stays valid.
    void shutdown() noexcept;
    void close() noexcept;

  private:
    int fd_ = -1;
  };

} // namespace connection
