#include "hexrot/simple_mock_controller.hpp"

#include "hexrot/errors.hpp"
#include "utils/logger.hpp"

#include <format>
#include <utility>

namespace hexrot {

namespace wire = connection::wire;

SimpleMockController::SimpleMockController(MockConfig cfg)
  : BaseMockController("SimpleMockController", std::move(cfg),
                       to_underlying(SimpleCommandCode::SET_STATE)) {
  add_param1_keyed_code(to_underlying(SimpleCommandCode::SET_ENABLED_SUBSTATE));
  add_command(to_underlying(SimpleCommandCode::MOVE),
              [this](const wire::Command& cmd) { return do_move(cmd); });
  add_command(to_underlying(SimpleCommandCode::CONFIG_VEL),
              [this](const wire::Command& cmd) { return do_config_velocity(cmd); });
}

SimpleMockController::~SimpleMockController() noexcept {
  close();
}

SimpleConfig SimpleMockController::config() const {
  std::lock_guard<std::mutex> lk(model_mtx_);
  return config_;
}

SimpleTelemetry SimpleMockController::telemetry() const {
  std::lock_guard<std::mutex> lk(model_mtx_);
  return snapshot_locked();
}

SimpleTelemetry SimpleMockController::snapshot_locked() const {
  SimpleTelemetry t = telemetry_;
  t.state = device().state;
  t.offline_substate = device().offline_substate;
  t.enabled_substate = device().enabled_substate;
  return t;
}

void SimpleMockController::encode_config(std::span<uint8_t> out) const {
  (void)encode_payload(out, config_);
}

void SimpleMockController::encode_telemetry(std::span<uint8_t> out) const {
  (void)encode_payload(out, snapshot_locked());
}

void SimpleMockController::update_telemetry() {
  telemetry_.application_status = DDS_COMMAND_SOURCE;
  telemetry_.curr_position += 0.001;
}

double SimpleMockController::do_move(const wire::Command& cmd) {
  assert_state(ControllerState::ENABLED);
  const double position = cmd.param1();
  if (!(position >= config_.min_position && position <= config_.max_position)) {
    throw CommandRejected(std::format("Commanded position {} out of range [{}, {}]; ignoring the command.",
                                      position, config_.min_position, config_.max_position));
  }
  telemetry_.cmd_position = position;
  telemetry_.curr_position = position;
  return 0.0;
}

double SimpleMockController::do_config_velocity(const wire::Command& cmd) {
  assert_state(ControllerState::ENABLED);
  const double max_velocity = cmd.param1();
  if (!(max_velocity > 0.0)) {
    throw CommandRejected(std::format("Commanded max velocity {} <= 0; ignoring the command.", max_velocity));
  }
  config_.max_velocity = max_velocity;
  request_config_write();
  logger::info() << "[MOCK] " << name() << ": max_velocity=" << max_velocity << "\n";
  return 0.0;
}

} // namespace hexrot
