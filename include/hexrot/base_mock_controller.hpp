#pragma once
#include "connection/one_client_server.hpp"
#include "connection/tcp_socket.hpp"
#include "connection/wire_codec.hpp"
#include "hexrot/enums.hpp"
#include "hexrot/runtime_config.hpp"
#include "hexrot/wrapping_counter.hpp"

#include <atomic>
#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace hexrot {

/**
 * @brief Device state machine plus the controller side of the protocol.
 *
 * Accepts one link connection at a time. Per connection it writes the Config
 * frame, then a Telemetry frame every telemetry interval, and answers each
 * Command with a CommandStatus carrying the command's counter.
 *
 * Commands are dispatched through a table keyed by (code) or, for codes
 * registered with add_param1_keyed_code(), by (code, param1). The standard
 * SET_STATE transitions are registered here; subclasses add device commands.
 * A handler returns the estimated duration (seconds) or throws
 * CommandRejected.
 *
 * Handlers and the encode/update hooks run with the model lock held.
 * Subclasses must call close() in their destructor.
 */
class BaseMockController {
public:
  using Handler = std::function<double(const connection::wire::Command&)>;

  struct CommandKey {
    uint32_t code{0};
    std::optional<uint32_t> param1;
    auto operator<=>(const CommandKey&) const = default;
  };

  BaseMockController(std::string name, MockConfig cfg, uint32_t set_state_code);
  virtual ~BaseMockController() noexcept;

  BaseMockController(const BaseMockController&) = delete;
  BaseMockController& operator=(const BaseMockController&) = delete;

  /// Start listening. False if the port could not be bound.
  [[nodiscard]] bool start();
  /// Stop listening, drop the client and stop its session.
  void close();

  [[nodiscard]] uint16_t port() const noexcept { return server_.port(); }
  [[nodiscard]] bool connected() const { return server_.connected(); }
  [[nodiscard]] bool wait_connected(std::chrono::milliseconds timeout) const {
    return server_.wait_connected(timeout);
  }
  /// Session threads not yet joined.
  [[nodiscard]] size_t session_count() const;
  /// Drop the current client (simulates a lost link).
  void close_client() { server_.close_client(); }

  [[nodiscard]] ControllerState state() const;
  [[nodiscard]] OfflineSubstate offline_substate() const;
  [[nodiscard]] EnabledSubstate enabled_substate() const;

  void set_state(ControllerState state);
  /// Simulate an externally detected fault.
  void set_fault();

  /// Run one command against the state machine and return the status to send.
  connection::wire::CommandStatus execute(const connection::wire::Command& cmd);

  /// Write a CommandStatus frame to the current client; the reason is
  /// truncated to the reason buffer. False if no client or the write failed.
  bool write_command_status(uint32_t counter, CommandStatusCode status, double duration,
                            std::string_view reason);
  /// Write the current Config frame to the current client.
  bool write_config();

protected:
  struct DeviceState {
    ControllerState state{ControllerState::OFFLINE};
    OfflineSubstate offline_substate{OfflineSubstate::AVAILABLE};
    EnabledSubstate enabled_substate{EnabledSubstate::NONE};
  };

  void add_command(uint32_t code, Handler handler);
  void add_command(uint32_t code, uint32_t param1, Handler handler);
  /// Commands with this code are looked up by (code, param1).
  void add_param1_keyed_code(uint32_t code);

  /// Throw CommandRejected unless the device is in `state` (and substates).
  void assert_state(ControllerState state,
                    std::optional<OfflineSubstate> offline_substate = std::nullopt,
                    std::optional<EnabledSubstate> enabled_substate = std::nullopt) const;

  /// Set state and the matching substates. Model lock must be held.
  void set_state_locked(ControllerState state);
  /// Write the Config frame before the status of the current command.
  void request_config_write() noexcept { config_write_requested_ = true; }

  [[nodiscard]] const DeviceState& device() const noexcept { return device_; }
  [[nodiscard]] const std::string& name() const noexcept { return name_; }

  virtual size_t config_size() const noexcept = 0;
  virtual size_t telemetry_size() const noexcept = 0;
  virtual void encode_config(std::span<uint8_t> out) const = 0;
  virtual void encode_telemetry(std::span<uint8_t> out) const = 0;
  /// Called once per telemetry tick before encode_telemetry.
  virtual void update_telemetry() = 0;

  mutable std::mutex model_mtx_;

private:
  CommandKey key_for(const connection::wire::Command& cmd) const;
  void on_connect_change(bool connected);
  void session(std::shared_ptr<connection::TcpSocket> sock);
  // CONFIG and TELEMETRY headers take the next per-kind counter;
  // COMMAND_STATUS headers carry `status_counter`.
  bool write_frame(connection::TcpSocket& sock, FrameId frame_id,
                   std::span<const uint8_t> payload, uint32_t status_counter = 0);
  bool write_config(connection::TcpSocket& sock);
  bool write_telemetry(connection::TcpSocket& sock);
  bool write_command_status(connection::TcpSocket& sock, uint32_t counter,
                            const connection::wire::CommandStatus& status);

  std::string name_;
  MockConfig cfg_;

  DeviceState device_;
  std::map<CommandKey, Handler> commands_;
  std::set<uint32_t> param1_keyed_codes_;
  bool config_write_requested_{false};

  // Guards the header counters and keeps frames from interleaving.
  std::mutex write_mtx_;
  WrappingCounter<uint32_t> config_counter_{0};
  WrappingCounter<uint32_t> telemetry_counter_{0};

  connection::OneClientServer server_;
  std::atomic<bool> stop_{false};

  struct Session {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };
  // Finished sessions are joined when the next client is adopted.
  mutable std::mutex sessions_mtx_;
  std::vector<Session> sessions_;
};

} // namespace hexrot
