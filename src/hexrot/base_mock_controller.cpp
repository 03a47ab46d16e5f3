#include "hexrot/base_mock_controller.hpp"

#include "hexrot/errors.hpp"
#include "utils/logger.hpp"
#include "utils/rate_limiter.hpp"
#include "utils/timestamp.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <exception>
#include <format>
#include <limits>
#include <utility>

namespace hexrot {

namespace wire = connection::wire;

BaseMockController::BaseMockController(std::string name, MockConfig cfg, uint32_t set_state_code)
  : name_(std::move(name)),
    cfg_(std::move(cfg)),
    server_(name_, cfg_.host, cfg_.port, [this](bool connected) { on_connect_change(connected); }) {
  add_param1_keyed_code(set_state_code);

  const auto transition = [this](ControllerState required, ControllerState next) {
    return [this, required, next](const wire::Command&) {
      assert_state(required);
      set_state_locked(next);
      return 0.0;
    };
  };

  add_command(set_state_code, to_underlying(SetStateParam::ENTER_CONTROL), [this](const wire::Command&) {
    assert_state(ControllerState::OFFLINE, OfflineSubstate::AVAILABLE);
    set_state_locked(ControllerState::STANDBY);
    return 0.0;
  });
  add_command(set_state_code, to_underlying(SetStateParam::START),
              transition(ControllerState::STANDBY, ControllerState::DISABLED));
  add_command(set_state_code, to_underlying(SetStateParam::ENABLE),
              transition(ControllerState::DISABLED, ControllerState::ENABLED));
  add_command(set_state_code, to_underlying(SetStateParam::DISABLE),
              transition(ControllerState::ENABLED, ControllerState::DISABLED));
  add_command(set_state_code, to_underlying(SetStateParam::STANDBY),
              transition(ControllerState::DISABLED, ControllerState::STANDBY));
  add_command(set_state_code, to_underlying(SetStateParam::EXIT),
              transition(ControllerState::STANDBY, ControllerState::OFFLINE));
  add_command(set_state_code, to_underlying(SetStateParam::CLEAR_ERROR), [this](const wire::Command&) {
    if (device_.state != ControllerState::FAULT && device_.state != ControllerState::STANDBY) {
      throw CommandRejected(std::format("state={}; must be FAULT or STANDBY for this command.",
                                        to_string(device_.state)));
    }
    set_state_locked(ControllerState::STANDBY);
    return 0.0;
  });

  set_state_locked(cfg_.initial_state);
}

BaseMockController::~BaseMockController() noexcept {
  close();
}

bool BaseMockController::start() {
  stop_.store(false);
  if (!server_.start()) {
    logger::error() << "[MOCK] " << name_ << ": could not start\n";
    return false;
  }
  logger::info() << "[MOCK] " << name_ << ": running on port " << server_.port()
                 << "; state=" << to_string(state()) << "\n";
  return true;
}

void BaseMockController::close() {
  stop_.store(true);
  server_.close();

  std::vector<Session> sessions;
  {
    std::lock_guard<std::mutex> lk(sessions_mtx_);
    sessions.swap(sessions_);
  }
  for (auto& s : sessions) {
    if (s.thread.joinable()) s.thread.join();
  }
}

size_t BaseMockController::session_count() const {
  std::lock_guard<std::mutex> lk(sessions_mtx_);
  return sessions_.size();
}

ControllerState BaseMockController::state() const {
  std::lock_guard<std::mutex> lk(model_mtx_);
  return device_.state;
}

OfflineSubstate BaseMockController::offline_substate() const {
  std::lock_guard<std::mutex> lk(model_mtx_);
  return device_.offline_substate;
}

EnabledSubstate BaseMockController::enabled_substate() const {
  std::lock_guard<std::mutex> lk(model_mtx_);
  return device_.enabled_substate;
}

void BaseMockController::set_state(ControllerState state) {
  std::lock_guard<std::mutex> lk(model_mtx_);
  set_state_locked(state);
}

void BaseMockController::set_fault() {
  logger::warn() << "[MOCK] " << name_ << ": fault\n";
  set_state(ControllerState::FAULT);
}

void BaseMockController::set_state_locked(ControllerState state) {
  device_.state = state;
  device_.offline_substate = (state == ControllerState::OFFLINE) ? OfflineSubstate::AVAILABLE
                                                                 : OfflineSubstate::NONE;
  device_.enabled_substate = (state == ControllerState::ENABLED) ? EnabledSubstate::STATIONARY
                                                                 : EnabledSubstate::NONE;
  logger::debug() << "[MOCK] " << name_ << ": set_state: state=" << to_string(device_.state)
                  << "; offline_substate=" << to_string(device_.offline_substate)
                  << "; enabled_substate=" << to_string(device_.enabled_substate) << "\n";
}

void BaseMockController::add_command(uint32_t code, Handler handler) {
  commands_[CommandKey{code, std::nullopt}] = std::move(handler);
}

void BaseMockController::add_command(uint32_t code, uint32_t param1, Handler handler) {
  commands_[CommandKey{code, param1}] = std::move(handler);
}

void BaseMockController::add_param1_keyed_code(uint32_t code) {
  param1_keyed_codes_.insert(code);
}

void BaseMockController::assert_state(ControllerState state,
                                      std::optional<OfflineSubstate> offline_substate,
                                      std::optional<EnabledSubstate> enabled_substate) const {
  if (device_.state != state) {
    throw CommandRejected(std::format("state={}; must be {} for this command.",
                                      to_string(device_.state), to_string(state)));
  }
  if (offline_substate && device_.offline_substate != *offline_substate) {
    throw CommandRejected(std::format("offline_substate={}; must be {} for this command.",
                                      to_string(device_.offline_substate), to_string(*offline_substate)));
  }
  if (enabled_substate && device_.enabled_substate != *enabled_substate) {
    throw CommandRejected(std::format("enabled_substate={}; must be {} for this command.",
                                      to_string(device_.enabled_substate), to_string(*enabled_substate)));
  }
}

BaseMockController::CommandKey BaseMockController::key_for(const wire::Command& cmd) const {
  if (!param1_keyed_codes_.contains(cmd.code)) return CommandKey{cmd.code, std::nullopt};

  const double p = cmd.param1();
  // A param1 that is not a small whole number cannot name a sub-command.
  if (!std::isfinite(p) || p < 0.0 || p > static_cast<double>(std::numeric_limits<uint32_t>::max()) ||
      p != std::floor(p)) {
    return CommandKey{cmd.code, std::numeric_limits<uint32_t>::max()};
  }
  return CommandKey{cmd.code, static_cast<uint32_t>(p)};
}

wire::CommandStatus BaseMockController::execute(const wire::Command& cmd) {
  wire::CommandStatus st{};
  std::lock_guard<std::mutex> lk(model_mtx_);
  logger::debug() << "[MOCK] " << name_ << ": execute: counter=" << cmd.counter << "; code=" << cmd.code
                  << "; param1=" << cmd.param1() << "\n";

  const auto it = commands_.find(key_for(cmd));
  if (it == commands_.end()) {
    st.status = to_underlying(CommandStatusCode::NO_ACK);
    st.reason = std::format("Unrecognized command code={}; param1={}", cmd.code, cmd.param1());
    logger::error() << "[MOCK] " << name_ << ": " << st.reason << "\n";
    return st;
  }

  try {
    st.duration = it->second(cmd);
    st.status = to_underlying(CommandStatusCode::ACK);
  } catch (const CommandRejected& e) {
    st.status = to_underlying(CommandStatusCode::NO_ACK);
    st.reason = e.reason();
    logger::warn() << "[MOCK] " << name_ << ": command code=" << cmd.code << "; param1=" << cmd.param1()
                   << " rejected: " << e.reason() << "\n";
  } catch (const std::exception& e) {
    st.status = to_underlying(CommandStatusCode::NO_ACK);
    st.reason = e.what();
    logger::error() << "[MOCK] " << name_ << ": command code=" << cmd.code << "; param1=" << cmd.param1()
                    << " failed: " << e.what() << "\n";
  }
  return st;
}

void BaseMockController::on_connect_change(bool connected) {
  if (!connected) {
    logger::info() << "[MOCK] " << name_ << ": link disconnected\n";
    return;
  }
  auto sock = server_.client();
  if (!sock) return;

  std::lock_guard<std::mutex> lk(sessions_mtx_);
  if (stop_.load()) return;
  // Only sessions that have returned are joined here: a live one may be
  // waiting on the acceptor, which holds its callback lock while we run.
  std::erase_if(sessions_, [](Session& s) {
    if (!s.done->load()) return false;
    s.thread.join();
    return true;
  });
  auto done = std::make_shared<std::atomic<bool>>(false);
  sessions_.push_back({std::thread([this, sock, done] {
                         session(sock);
                         done->store(true);
                       }),
                       done});
}

void BaseMockController::session(std::shared_ptr<connection::TcpSocket> sock) {
  logger::info() << "[MOCK] " << name_ << ": session begins\n";
  {
    std::lock_guard<std::mutex> lk(model_mtx_);
    config_write_requested_ = false;
  }

  utils::RateLimiter rate;
  rate.set_period(cfg_.telemetry_interval);
  rate.reset();

  std::array<uint8_t, wire::kCommandSize> buf{};
  bool ok = write_config(*sock);

  while (ok && !stop_.load()) {
    if (rate.due()) {
      ok = write_telemetry(*sock);
      rate.advance();
      continue;
    }

    const auto wait = std::chrono::ceil<std::chrono::milliseconds>(rate.time_until_deadline());
    const auto r = sock->wait_readable(wait);
    if (r == connection::WaitResult::Timeout) continue;
    if (r == connection::WaitResult::Error || !sock->recv_all(buf.data(), buf.size())) break;

    wire::Command cmd{};
    (void)wire::decode_command(buf, cmd);
    const auto status = execute(cmd);

    bool config_changed = false;
    {
      std::lock_guard<std::mutex> lk(model_mtx_);
      config_changed = std::exchange(config_write_requested_, false);
    }
    if (config_changed) ok = write_config(*sock);
    if (ok) ok = write_command_status(*sock, cmd.counter, status);
  }

  logger::info() << "[MOCK] " << name_ << ": session ends; skipped telemetry ticks=" << rate.skipped_ticks() << "\n";
  server_.close_client(sock);
}

bool BaseMockController::write_frame(connection::TcpSocket& sock, FrameId frame_id,
                                     std::span<const uint8_t> payload, uint32_t status_counter) {
  std::vector<uint8_t> frame(wire::kHeaderSize + payload.size());
  std::copy(payload.begin(), payload.end(),
            frame.begin() + static_cast<std::ptrdiff_t>(wire::kHeaderSize));

  const auto tai = utils::tai_now();
  wire::Header hdr{};
  hdr.frame_id = to_underlying(frame_id);
  hdr.tai_sec = tai.sec;
  hdr.tai_nsec = tai.nsec;

  std::lock_guard<std::mutex> lk(write_mtx_);
  switch (frame_id) {
    case FrameId::CONFIG: hdr.counter = config_counter_.next(); break;
    case FrameId::TELEMETRY: hdr.counter = telemetry_counter_.next(); break;
    case FrameId::COMMAND_STATUS: hdr.counter = status_counter; break;
  }
  (void)wire::encode_header(std::span<uint8_t>(frame.data(), wire::kHeaderSize), hdr);
  return sock.send_all(frame.data(), frame.size());
}

bool BaseMockController::write_config(connection::TcpSocket& sock) {
  std::vector<uint8_t> payload(config_size());
  {
    std::lock_guard<std::mutex> lk(model_mtx_);
    encode_config(payload);
  }
  return write_frame(sock, FrameId::CONFIG, payload);
}

bool BaseMockController::write_telemetry(connection::TcpSocket& sock) {
  std::vector<uint8_t> payload(telemetry_size());
  {
    std::lock_guard<std::mutex> lk(model_mtx_);
    update_telemetry();
    encode_telemetry(payload);
  }
  return write_frame(sock, FrameId::TELEMETRY, payload);
}

bool BaseMockController::write_command_status(connection::TcpSocket& sock, uint32_t counter,
                                              const wire::CommandStatus& status) {
  std::array<uint8_t, wire::kCommandStatusSize> payload{};
  (void)wire::encode_command_status(payload, status);
  return write_frame(sock, FrameId::COMMAND_STATUS, payload, counter);
}

bool BaseMockController::write_command_status(uint32_t counter, CommandStatusCode status,
                                              double duration, std::string_view reason) {
  auto sock = server_.client();
  if (!sock) return false;
  wire::CommandStatus st{};
  st.status = to_underlying(status);
  st.duration = duration;
  st.reason = std::string(reason.substr(0, wire::kReasonSize));
  return write_command_status(*sock, counter, st);
}

bool BaseMockController::write_config() {
  auto sock = server_.client();
  if (!sock) return false;
  return write_config(*sock);
}

} // namespace hexrot
