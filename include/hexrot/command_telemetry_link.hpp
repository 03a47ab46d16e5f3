#pragma once
#include "connection/tcp_socket.hpp"
#include "connection/wire_codec.hpp"
#include "hexrot/runtime_config.hpp"
#include "hexrot/wrapping_counter.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <thread>
#include <vector>

namespace hexrot {

/**
 * @brief Receiver of the events decoded by a CommandTelemetryLink.
 *
 * All calls except on_connect_change(true) arrive on the link's reader thread,
 * in wire order. Implementations must not throw.
 */
class LinkListener {
public:
  virtual ~LinkListener() = default;

  virtual void on_connect_change(bool connected) = 0;
  virtual void on_config(const connection::wire::Header& hdr, std::span<const uint8_t> payload) = 0;
  virtual void on_telemetry(const connection::wire::Header& hdr, std::span<const uint8_t> payload) = 0;
  /// The link was torn down; anything still waiting on it must fail.
  virtual void on_closed() = 0;
};

/**
 * @brief One TCP connection to a controller, carrying commands one way and
 * CommandStatus / Config / Telemetry frames the other way.
 *
 * Device independent: config and telemetry payloads are handed to the
 * listener as raw bytes of the sizes given at construction. See
 * CommandTelemetryClient for the typed front end.
 *
 * Commands are serialized by a single lock. Each command gets the next value
 * of a wrapping counter and the link waits (bounded by command_timeout) for the
 * CommandStatus whose header counter matches it; any other status is logged
 * and discarded.
 *
 * A link is single use: connect() may be called once, and after close() a new
 * instance is required.
 */
class CommandTelemetryLink {
public:
  CommandTelemetryLink(ClientConfig cfg, size_t config_size, size_t telemetry_size,
                       LinkListener& listener);
  ~CommandTelemetryLink() noexcept;

  CommandTelemetryLink(const CommandTelemetryLink&) = delete;
  CommandTelemetryLink& operator=(const CommandTelemetryLink&) = delete;

  /// Connect, retrying until connect_timeout, and start the reader thread.
  /// Throws TransportError on timeout or cancellation, std::logic_error if
  /// called twice.
  void connect();

  /// Tear down the connection but keep should_be_connected() as it was.
  void basic_close();
  /// Tear down the connection and cancel an in-progress connect().
  void close();

  [[nodiscard]] bool connected() const noexcept { return connected_.load(); }
  /// True between a successful connect() and close(); stays true after an
  /// unexpected drop, so a caller can tell a drop from an intentional close.
  [[nodiscard]] bool should_be_connected() const noexcept { return should_be_connected_.load(); }

  /// Send one command and wait for its status. Returns the estimated duration
  /// (seconds). Throws CommandRejected, CommandTimeout or TransportError.
  double run_command(connection::wire::Command cmd);

  /// Run several commands without letting another caller's command in
  /// between; optional delay between commands. Stops at the first failure.
  std::vector<double> run_commands(const std::vector<connection::wire::Command>& cmds,
                                   Seconds delay = Seconds{0.0});

  [[nodiscard]] connection::wire::Command make_command(uint32_t code,
                                                       double param1 = 0.0, double param2 = 0.0,
                                                       double param3 = 0.0, double param4 = 0.0,
                                                       double param5 = 0.0, double param6 = 0.0) const;

  /// Bytes discarded after a header with an unknown frame id.
  [[nodiscard]] size_t resync_size() const noexcept { return resync_size_; }

  [[nodiscard]] const ClientConfig& client_config() const noexcept { return cfg_; }

private:
  struct Pending {
    uint32_t counter{0};
    bool active{false};
    bool done{false};
    bool aborted{false};
    connection::wire::CommandStatus status{};
  };

  double run_command_locked(connection::wire::Command cmd);
  void read_loop(connection::TcpSocket* sock);
  void handle_command_status(const connection::wire::Header& hdr, std::span<const uint8_t> payload);
  void teardown();
  void call_connect_callback();

  ClientConfig cfg_;
  size_t config_size_;
  size_t telemetry_size_;
  size_t resync_size_;
  LinkListener& listener_;

  // Socket, reader thread and connect bookkeeping.
  mutable std::mutex io_mtx_;
  std::condition_variable io_cv_;
  std::unique_ptr<connection::TcpSocket> sock_;
  std::thread reader_;
  bool connect_called_{false};
  bool closing_{false};

  std::atomic<bool> connected_{false};
  std::atomic<bool> should_be_connected_{false};

  // Serializes commands; guards counter_.
  std::mutex command_mtx_;
  WrappingCounter<uint32_t> counter_;

  std::mutex pending_mtx_;
  std::condition_variable pending_cv_;
  Pending pending_;

  // Recursive: a connect callback may close the link from the reader thread.
  std::recursive_mutex cb_mtx_;
  bool last_connected_{false};
};

} // namespace hexrot
