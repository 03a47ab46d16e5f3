#pragma once
#include "connection/tcp_socket.hpp"
#include "connection/wire_codec.hpp"
#include "hexrot/enums.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace tests {

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

/**
 * @brief Scriptable controller end of a link, for unit tests.
 *
 * - listen() binds an ephemeral port on 127.0.0.1.
 * - accept() takes the link's connection.
 * - read_command() / write_*() move raw records so tests control every byte.
 */
class FakeController {
public:
  bool listen(uint16_t port = 0) {
    if (!listener_.bind_listen("127.0.0.1", port, 4)) return false;
    port_ = listener_.local_port();
    return port_ != 0;
  }

  uint16_t port() const noexcept { return port_; }

  bool accept(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    if (listener_.wait_readable(timeout) != connection::WaitResult::Ready) return false;
    return listener_.accept_client(client_, false);
  }

  bool read_command(connection::wire::Command& out,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    if (client_.wait_readable(timeout) != connection::WaitResult::Ready) return false;
    std::array<uint8_t, connection::wire::kCommandSize> buf{};
    if (!client_.recv_all(buf.data(), buf.size())) return false;
    return connection::wire::decode_command(buf, out);
  }

  /// True if nothing arrives from the link within `timeout`.
  bool quiet_for(std::chrono::milliseconds timeout) const {
    return client_.wait_readable(timeout) == connection::WaitResult::Timeout;
  }

  bool write_frame(uint16_t frame_id, uint32_t counter, std::span<const uint8_t> payload) {
    std::vector<uint8_t> frame(connection::wire::kHeaderSize + payload.size());
    connection::wire::Header hdr{};
    hdr.frame_id = frame_id;
    hdr.counter = counter;
    hdr.tai_sec = 1'700'000'037;
    hdr.tai_nsec = 500'000'000;
    if (!connection::wire::encode_header(std::span<uint8_t>(frame.data(), connection::wire::kHeaderSize), hdr)) {
      return false;
    }
    for (size_t i = 0; i < payload.size(); ++i) frame[connection::wire::kHeaderSize + i] = payload[i];
    return write_raw(frame);
  }

  bool write_status(uint32_t counter, hexrot::CommandStatusCode code, double duration,
                    std::string_view reason = {}) {
    connection::wire::CommandStatus st{};
    st.status = hexrot::to_underlying(code);
    st.duration = duration;
    st.reason = std::string(reason);
    std::array<uint8_t, connection::wire::kCommandStatusSize> buf{};
    if (!connection::wire::encode_command_status(buf, st)) return false;
    return write_frame(hexrot::to_underlying(hexrot::FrameId::COMMAND_STATUS), counter, buf);
  }

  bool write_raw(std::span<const uint8_t> bytes) {
    return client_.send_all(bytes.data(), bytes.size());
  }

  void drop_client() { client_.close(); }
  void close() {
    client_.close();
    listener_.close();
  }

private:
  connection::TcpSocket listener_;
  connection::TcpSocket client_;
  uint16_t port_{0};
};

} // namespace tests
