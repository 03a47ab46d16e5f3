#include "connection/tcp_socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

namespace connection {

static bool set_nonblocking_fd(int fd, bool on) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  if (on) {
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
  }
  return fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) == 0;
}

static bool make_addr(std::string_view ip, uint16_t port, ::sockaddr_in& addr) {
  addr = {};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  const std::string ip_str(ip == "localhost" ? std::string_view("127.0.0.1") : ip);
  return inet_pton(AF_INET, ip_str.c_str(), &addr.sin_addr) == 1;
}

static int poll_timeout_ms(std::chrono::milliseconds timeout) {
  if (timeout.count() < 0) return 0;
  if (timeout.count() > 0x7fffffff) return 0x7fffffff;
  return static_cast<int>(timeout.count());
}

TcpSocket::TcpSocket() {
  fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
}

TcpSocket::~TcpSocket() noexcept {
  close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept {
  fd_ = std::exchange(other.fd_, -1);
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
  if (this == &other) return *this;
  close();
  fd_ = std::exchange(other.fd_, -1);
  return *this;
}

void TcpSocket::shutdown() noexcept {
  if (fd_ >= 0) (void)::shutdown(fd_, SHUT_RDWR);
}

void TcpSocket::close() noexcept {
  if (fd_ >= 0) ::close(fd_);
  fd_ = -1;
}

bool TcpSocket::connect_with_timeout(std::string_view ip, uint16_t port,
                                     std::chrono::milliseconds timeout) {
  if (fd_ < 0) return false;

  ::sockaddr_in addr{};
  if (!make_addr(ip, port, addr)) return false;
  if (!set_nonblocking_fd(fd_, true)) return false;

  if (::connect(fd_, (sockaddr*)&addr, sizeof(addr)) != 0) {
    if (errno != EINPROGRESS) return false;

    ::pollfd fds{};
    fds.fd = fd_;
    fds.events = POLLOUT;
    int rc = 0;
    do {
      rc = ::poll(&fds, 1, poll_timeout_ms(timeout));
    } while (rc < 0 && errno == EINTR);
    if (rc <= 0) return false;

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) return false;
    if (so_error != 0) {
      errno = so_error;
      return false;
    }
  }

  return set_nonblocking_fd(fd_, false);
}

bool TcpSocket::bind_listen(std::string_view local_addr, uint16_t local_port, int backlog) {
  if (fd_ < 0) return false;

  int reuse = 1;
  (void)setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  ::sockaddr_in addr{};
  if (!make_addr(local_addr, local_port, addr)) return false;

  if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) != 0) return false;
  return ::listen(fd_, backlog) == 0;
}

bool TcpSocket::accept_client(TcpSocket& out, bool nonblocking) {
  if (fd_ < 0) return false;

  int cfd = -1;
  for (;;) {
    cfd = ::accept(fd_, nullptr, nullptr);
    if (cfd >= 0) break;
    if (errno == EINTR) continue;
    return false;
  }

  // Accepted sockets may inherit O_NONBLOCK from the listener on some platforms.
  if (!set_nonblocking_fd(cfd, nonblocking)) {
    ::close(cfd);
    return false;
  }

  out.close();
  out.fd_ = cfd;
  return true;
}

bool TcpSocket::set_nodelay(bool on) {
  if (fd_ < 0) return false;
  int flag = on ? 1 : 0;
  return setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) == 0;
}

uint16_t TcpSocket::local_port() const noexcept {
  if (fd_ < 0) return 0;
  ::sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd_, (sockaddr*)&addr, &len) != 0) return 0;
  return ntohs(addr.sin_port);
}

WaitResult TcpSocket::wait_readable(std::chrono::milliseconds timeout) const {
  if (fd_ < 0) return WaitResult::Error;
  ::pollfd fds{};
  fds.fd = fd_;
  fds.events = POLLIN;
  const int rc = ::poll(&fds, 1, poll_timeout_ms(timeout));
  if (rc < 0) return (errno == EINTR) ? WaitResult::Timeout : WaitResult::Error;
  if (rc == 0) return WaitResult::Timeout;
  // POLLHUP/POLLERR also count as "ready": the following recv reports it.
  return WaitResult::Ready;
}

bool TcpSocket::send_all(const void* data, size_t len) const {
  if (fd_ < 0) return false;
  const uint8_t* p = static_cast<const uint8_t*>(data);
  size_t sent = 0;
  while (sent < len) {
    const int flags =
#ifdef MSG_NOSIGNAL
      MSG_NOSIGNAL;
#else
      0;
#endif
    const ssize_t n = ::send(fd_, p + sent, len - sent, flags);
    if (n > 0) {
      sent += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      // wait until writable
      ::pollfd fds{};
      fds.fd = fd_;
      fds.events = POLLOUT;
      const int rc = ::poll(&fds, 1, 50);
      if (rc <= 0) return false;
      continue;
    }
    return false; // other error
  }
  return true;
}

bool TcpSocket::recv_all(void* data, size_t len) const {
  if (fd_ < 0) return false;
  uint8_t* p = static_cast<uint8_t*>(data);
  size_t recvd = 0;
  while (recvd < len) {
    const ssize_t n = ::recv(fd_, p + recvd, len - recvd, 0);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    recvd += static_cast<size_t>(n);
  }
  return true;
}

bool TcpSocket::try_recv(void* data, size_t len, size_t& out_nbytes) const {
  out_nbytes = 0;
  if (fd_ < 0) return false;
  const ssize_t n = ::recv(fd_, data, len, MSG_DONTWAIT);
  if (n < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      // No data available right now.
      out_nbytes = 0;
      return true;
    }
    return false;
  }
  if (n == 0) {
    // Peer closed.
    out_nbytes = 0;
    return false;
  }
  out_nbytes = static_cast<size_t>(n);
  return true;
}

} // namespace connection
