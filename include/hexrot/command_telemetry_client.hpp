#pragma once
#include "connection/wire_codec.hpp"
#include "hexrot/command_telemetry_link.hpp"
#include "hexrot/enums.hpp"
#include "hexrot/errors.hpp"
#include "hexrot/runtime_config.hpp"
#include "utils/logger.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace hexrot {

/**
 * @brief A fixed-size record carried in a controller frame.
 *
 * The record declares its frame id and encoded size, and provides
 * encode_payload / decode_payload free functions found by ADL.
 */
template <typename T>
concept WireRecord = std::default_initializable<T> && std::copyable<T> &&
  requires(const T& value, T& out, std::span<uint8_t> obuf, std::span<const uint8_t> ibuf) {
    { T::kFrameId } -> std::convertible_to<FrameId>;
    { T::kWireSize } -> std::convertible_to<size_t>;
    { encode_payload(obuf, value) } -> std::same_as<bool>;
    { decode_payload(ibuf, out) } -> std::same_as<bool>;
  };

/**
 * @brief Typed front end of a CommandTelemetryLink for one device.
 *
 * Keeps the latest Config and Telemetry, forwards them to the registered
 * callbacks and to next_telemetry() waiters. Callback exceptions are logged and
 * never reach the link's reader thread. Snapshots are returned by copy.
 *
 * Usage:
 *   hexrot::CommandTelemetryClient<SimpleConfig, SimpleTelemetry> client(cfg, callbacks);
 *   client.connect();
 *   client.configured().wait();
 *   auto next = client.next_telemetry();
 *   client.run_command(client.make_command(code, param1));
 *   auto tel = next.get();
 */
template <WireRecord Config, WireRecord Telemetry>
class CommandTelemetryClient final : private LinkListener {
public:
  struct Callbacks {
    std::function<void(bool connected)> on_connect;
    std::function<void(const Config&)> on_config;
    std::function<void(const Telemetry&)> on_telemetry;
  };

  explicit CommandTelemetryClient(ClientConfig cfg, Callbacks callbacks = {})
    : callbacks_(std::move(callbacks)),
      configured_future_(configured_promise_.get_future().share()),
      link_(std::move(cfg), Config::kWireSize, Telemetry::kWireSize, *this) {}

  ~CommandTelemetryClient() noexcept override { link_.close(); }

  CommandTelemetryClient(const CommandTelemetryClient&) = delete;
  CommandTelemetryClient& operator=(const CommandTelemetryClient&) = delete;

  void connect() { link_.connect(); }
  void basic_close() { link_.basic_close(); }
  void close() { link_.close(); }

  [[nodiscard]] bool connected() const noexcept { return link_.connected(); }
  [[nodiscard]] bool should_be_connected() const noexcept { return link_.should_be_connected(); }

  double run_command(const connection::wire::Command& cmd) { return link_.run_command(cmd); }

  std::vector<double> run_commands(const std::vector<connection::wire::Command>& cmds,
                                   Seconds delay = Seconds{0.0}) {
    return link_.run_commands(cmds, delay);
  }

  [[nodiscard]] connection::wire::Command make_command(uint32_t code,
                                                       double param1 = 0.0, double param2 = 0.0,
                                                       double param3 = 0.0, double param4 = 0.0,
                                                       double param5 = 0.0, double param6 = 0.0) const {
    return link_.make_command(code, param1, param2, param3, param4, param5, param6);
  }

  /// Resolved after the first config frame whose callback did not throw.
  /// Fails with TransportError if the link closes first.
  [[nodiscard]] std::shared_future<void> configured() const { return configured_future_; }

  /// The telemetry received after this call (never the cached one).
  /// Fails with TransportError if the link closes first.
  [[nodiscard]] std::future<Telemetry> next_telemetry() {
    std::promise<Telemetry> p;
    auto f = p.get_future();
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_) {
      p.set_exception(std::make_exception_ptr(TransportError("link is closed")));
    } else {
      waiters_.push_back(std::move(p));
    }
    return f;
  }

  [[nodiscard]] std::optional<Config> config() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return config_;
  }

  [[nodiscard]] Telemetry telemetry() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return telemetry_;
  }

  [[nodiscard]] uint64_t telemetry_count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return telemetry_count_;
  }

  [[nodiscard]] const CommandTelemetryLink& link() const noexcept { return link_; }

private:
  void on_connect_change(bool connected) override {
    if (!callbacks_.on_connect) return;
    try {
      callbacks_.on_connect(connected);
    } catch (const std::exception& e) {
      logger::error() << "[LINK] connect callback failed: " << e.what() << "\n";
    }
  }

  void on_config(const connection::wire::Header&, std::span<const uint8_t> payload) override {
    Config cfg{};
    if (!decode_payload(payload, cfg)) {
      logger::error() << "[LINK] Could not decode config payload of " << payload.size() << " bytes\n";
      return;
    }
    {
      std::lock_guard<std::mutex> lk(mtx_);
      config_ = cfg;
    }

    if (callbacks_.on_config) {
      try {
        callbacks_.on_config(cfg);
      } catch (const std::exception& e) {
        logger::error() << "[LINK] config callback failed: " << e.what() << "\n";
        return;
      }
    }

    std::lock_guard<std::mutex> lk(mtx_);
    if (!configured_set_) {
      configured_set_ = true;
      configured_promise_.set_value();
    }
  }

  void on_telemetry(const connection::wire::Header&, std::span<const uint8_t> payload) override {
    Telemetry tel{};
    if (!decode_payload(payload, tel)) {
      logger::error() << "[LINK] Could not decode telemetry payload of " << payload.size() << " bytes\n";
      return;
    }

    std::vector<std::promise<Telemetry>> waiters;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      telemetry_ = tel;
      ++telemetry_count_;
      waiters.swap(waiters_);
    }
    for (auto& w : waiters) w.set_value(tel);

    if (!callbacks_.on_telemetry) return;
    try {
      callbacks_.on_telemetry(tel);
    } catch (const std::exception& e) {
      logger::error() << "[LINK] telemetry callback failed: " << e.what() << "\n";
    }
  }

  void on_closed() override {
    std::vector<std::promise<Telemetry>> waiters;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      closed_ = true;
      waiters.swap(waiters_);
      if (!configured_set_) {
        configured_set_ = true;
        configured_promise_.set_exception(
          std::make_exception_ptr(TransportError("link closed before config arrived")));
      }
    }
    for (auto& w : waiters) {
      w.set_exception(std::make_exception_ptr(TransportError("link closed while waiting for telemetry")));
    }
  }

  Callbacks callbacks_;

  mutable std::mutex mtx_;
  std::optional<Config> config_;
  Telemetry telemetry_{};
  uint64_t telemetry_count_{0};
  std::vector<std::promise<Telemetry>> waiters_;
  bool closed_{false};

  std::promise<void> configured_promise_;
  bool configured_set_{false};
  std::shared_future<void> configured_future_;

  // Last member: its reader thread calls back into the members above.
  CommandTelemetryLink link_;
};

} // namespace hexrot
