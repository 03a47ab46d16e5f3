#include "hexrot/command_telemetry_link.hpp"

#include "hexrot/enums.hpp"
#include "hexrot/errors.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace hexrot {

namespace wire = connection::wire;
using clock = std::chrono::steady_clock;

CommandTelemetryLink::CommandTelemetryLink(ClientConfig cfg, size_t config_size,
                                           size_t telemetry_size, LinkListener& listener)
  : cfg_(std::move(cfg)),
    config_size_(config_size),
    telemetry_size_(telemetry_size),
    resync_size_(std::max({config_size, telemetry_size, wire::kCommandStatusSize})),
    listener_(listener),
    counter_(cfg_.first_command_counter) {}

CommandTelemetryLink::~CommandTelemetryLink() noexcept {
  close();
}

void CommandTelemetryLink::connect() {
  {
    std::lock_guard<std::mutex> lk(io_mtx_);
    if (connect_called_) throw std::logic_error("connect may only be called once per link");
    connect_called_ = true;
    if (closing_) throw TransportError("link is closed");
  }

  const auto deadline = clock::now() + std::chrono::duration_cast<clock::duration>(cfg_.connect_timeout);
  const auto retry = std::chrono::duration_cast<clock::duration>(cfg_.connect_retry_interval);
  logger::info() << "[LINK] Connecting to " << cfg_.host << ":" << cfg_.port << "\n";

  std::unique_ptr<connection::TcpSocket> sock;
  for (;;) {
    const auto remaining = deadline - clock::now();
    if (remaining <= clock::duration::zero()) {
      logger::error() << "[LINK] Timed out connecting to " << cfg_.host << ":" << cfg_.port << "\n";
      throw TransportError("timed out connecting to " + cfg_.host + ":" + std::to_string(cfg_.port));
    }

    // A single attempt is not interruptible, so it is capped at the retry
    // interval; close() takes effect between attempts.
    const auto attempt = std::max(std::chrono::duration_cast<std::chrono::milliseconds>(std::min(remaining, retry)),
                                  std::chrono::milliseconds{1});
    auto candidate = std::make_unique<connection::TcpSocket>();
    if (candidate->connect_with_timeout(cfg_.host, cfg_.port, attempt)) {
      sock = std::move(candidate);
      break;
    }
    candidate->close();
    logger::debug() << "[LINK] Connect attempt failed; retrying\n";

    std::unique_lock<std::mutex> lk(io_mtx_);
    const auto wait = std::min(retry, std::max(deadline - clock::now(), clock::duration::zero()));
    if (io_cv_.wait_for(lk, wait, [this] { return closing_; })) {
      logger::warn() << "[LINK] Connect cancelled\n";
      throw TransportError("connect cancelled by close");
    }
  }

  if (!sock->set_nodelay(true)) {
    logger::debug() << "[LINK] TCP_NODELAY not set\n";
  }

  {
    // close() sets closing_ under the same lock, so it either cancels here or
    // finds the reader running and joins it.
    std::lock_guard<std::mutex> lk(io_mtx_);
    if (closing_) {
      sock->close();
      logger::warn() << "[LINK] Connect cancelled\n";
      throw TransportError("connect cancelled by close");
    }
    sock_ = std::move(sock);
    connected_.store(true);
    should_be_connected_.store(true);
    // The reader runs before the callback so a command issued from it gets its status.
    reader_ = std::thread([this, raw = sock_.get()] { read_loop(raw); });
  }
  logger::info() << "[LINK] Connected to " << cfg_.host << ":" << cfg_.port << "\n";
  call_connect_callback();
}

void CommandTelemetryLink::read_loop(connection::TcpSocket* sock) {
  std::array<uint8_t, wire::kHeaderSize> hbuf{};
  std::vector<uint8_t> payload(resync_size_);

  for (;;) {
    if (!sock->recv_all(hbuf.data(), hbuf.size())) break;
    wire::Header hdr{};
    (void)wire::decode_header(hbuf, hdr);

    size_t n = 0;
    switch (static_cast<FrameId>(hdr.frame_id)) {
      case FrameId::COMMAND_STATUS: n = wire::kCommandStatusSize; break;
      case FrameId::CONFIG: n = config_size_; break;
      case FrameId::TELEMETRY: n = telemetry_size_; break;
      default:
        logger::error() << "[LINK] Invalid header read: unknown frame_id=" << hdr.frame_id
                        << "; discarding " << resync_size_ << " bytes\n";
        n = resync_size_;
        break;
    }

    if (!sock->recv_all(payload.data(), n)) break;
    const std::span<const uint8_t> data(payload.data(), n);

    switch (static_cast<FrameId>(hdr.frame_id)) {
      case FrameId::COMMAND_STATUS: handle_command_status(hdr, data); break;
      case FrameId::CONFIG: listener_.on_config(hdr, data); break;
      case FrameId::TELEMETRY: listener_.on_telemetry(hdr, data); break;
      default: break;
    }
  }

  bool intentional = false;
  {
    std::lock_guard<std::mutex> lk(io_mtx_);
    intentional = closing_;
  }
  if (!intentional) {
    logger::warn() << "[LINK] Connection to " << cfg_.host << ":" << cfg_.port << " lost\n";
  }
  teardown();
}

void CommandTelemetryLink::handle_command_status(const wire::Header& hdr,
                                                 std::span<const uint8_t> payload) {
  wire::CommandStatus status{};
  (void)wire::decode_command_status(payload, status);

  std::lock_guard<std::mutex> lk(pending_mtx_);
  if (!pending_.active || pending_.done || hdr.counter != pending_.counter) {
    logger::warn() << "[LINK] Discarding command status with counter=" << hdr.counter
                   << (pending_.active ? "; expected counter=" + std::to_string(pending_.counter)
                                       : std::string("; no command pending"))
                   << "\n";
    return;
  }
  pending_.status = std::move(status);
  pending_.done = true;
  pending_cv_.notify_all();
}

double CommandTelemetryLink::run_command(wire::Command cmd) {
  std::lock_guard<std::mutex> lk(command_mtx_);
  return run_command_locked(cmd);
}

std::vector<double> CommandTelemetryLink::run_commands(const std::vector<wire::Command>& cmds,
                                                       Seconds delay) {
  std::vector<double> durations;
  durations.reserve(cmds.size());
  std::lock_guard<std::mutex> lk(command_mtx_);
  for (size_t i = 0; i < cmds.size(); ++i) {
    if (i > 0 && delay.count() > 0.0) std::this_thread::sleep_for(delay);
    durations.push_back(run_command_locked(cmds[i]));
  }
  return durations;
}

wire::Command CommandTelemetryLink::make_command(uint32_t code, double param1, double param2,
                                                 double param3, double param4, double param5,
                                                 double param6) const {
  wire::Command cmd{};
  cmd.commander = to_underlying(cfg_.commander);
  cmd.code = code;
  cmd.param = {param1, param2, param3, param4, param5, param6};
  return cmd;
}

double CommandTelemetryLink::run_command_locked(wire::Command cmd) {
  if (!connected()) throw TransportError("not connected");

  cmd.commander = to_underlying(cfg_.commander);
  cmd.counter = counter_.next();

  std::array<uint8_t, wire::kCommandSize> buf{};
  (void)wire::encode_command(buf, cmd);

  {
    std::lock_guard<std::mutex> lk(pending_mtx_);
    pending_ = Pending{};
    pending_.counter = cmd.counter;
    pending_.active = true;
  }

  logger::debug() << "[LINK] run_command: code=" << cmd.code << " counter=" << cmd.counter
                  << " param1=" << cmd.param[0] << "\n";

  bool sent = false;
  {
    std::lock_guard<std::mutex> lk(io_mtx_);
    sent = sock_ && sock_->send_all(buf.data(), buf.size());
  }
  if (!sent) {
    {
      std::lock_guard<std::mutex> lk(pending_mtx_);
      pending_.active = false;
    }
    logger::error() << "[LINK] Failed to write command counter=" << cmd.counter << "\n";
    teardown();
    throw TransportError("failed to write command");
  }

  std::unique_lock<std::mutex> lk(pending_mtx_);
  const bool finished = pending_cv_.wait_for(lk, cfg_.command_timeout,
                                             [this] { return pending_.done || pending_.aborted; });
  Pending result = std::move(pending_);
  pending_ = Pending{};
  lk.unlock();

  if (result.aborted) throw TransportError("connection closed while waiting for command status");
  if (!finished) {
    logger::warn() << "[LINK] Command counter=" << cmd.counter << " timed out after "
                   << cfg_.command_timeout.count() << " s\n";
    throw CommandTimeout("no command status for counter " + std::to_string(cmd.counter) + " within " +
                         std::to_string(cfg_.command_timeout.count()) + " s");
  }

  const auto code = static_cast<CommandStatusCode>(result.status.status);
  if (code == CommandStatusCode::ACK) return result.status.duration;
  if (code == CommandStatusCode::NO_ACK) throw CommandRejected(result.status.reason);
  throw CommandRejected("unknown command status " + std::to_string(result.status.status));
}

void CommandTelemetryLink::basic_close() {
  {
    std::lock_guard<std::mutex> lk(io_mtx_);
    closing_ = true;
  }
  io_cv_.notify_all();
  teardown();
}

void CommandTelemetryLink::close() {
  {
    std::lock_guard<std::mutex> lk(io_mtx_);
    closing_ = true;
    should_be_connected_.store(false);
  }
  basic_close();
}

void CommandTelemetryLink::teardown() {
  std::thread reader;
  {
    std::lock_guard<std::mutex> lk(io_mtx_);
    if (sock_) sock_->shutdown();
    // The reader tears itself down; it cannot join itself.
    if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
      reader = std::move(reader_);
    }
  }
  if (reader.joinable()) reader.join();

  std::unique_ptr<connection::TcpSocket> sock;
  {
    std::lock_guard<std::mutex> lk(io_mtx_);
    // The reader thread still uses the socket until it exits.
    if (!reader_.joinable() || reader_.get_id() != std::this_thread::get_id()) {
      sock = std::move(sock_);
    }
  }
  if (sock) sock->close();
  connected_.store(false);

  {
    std::lock_guard<std::mutex> lk(pending_mtx_);
    if (pending_.active && !pending_.done) {
      pending_.aborted = true;
      pending_cv_.notify_all();
    }
  }

  listener_.on_closed();
  call_connect_callback();
}

void CommandTelemetryLink::call_connect_callback() {
  std::lock_guard<std::recursive_mutex> lk(cb_mtx_);
  const bool now = connected();
  if (now == last_connected_) return;
  last_connected_ = now;
  listener_.on_connect_change(now);
}

} // namespace hexrot
