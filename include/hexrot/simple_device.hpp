#pragma once
#include "hexrot/command_telemetry_client.hpp"
#include "hexrot/enums.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace hexrot {

// Command codes understood by the simple device.
enum class SimpleCommandCode : uint32_t {
  SET_STATE = 1,
  SET_ENABLED_SUBSTATE = 2,
  MOVE = 3,
  CONFIG_VEL = 4,
};

std::string_view to_string(SimpleCommandCode v) noexcept;

// Wire: min_position f64, max_position f64, max_velocity f64.
struct SimpleConfig {
  static constexpr FrameId kFrameId = FrameId::CONFIG;
  static constexpr size_t kWireSize = 24;

  double min_position{-25.0};
  double max_position{25.0};
  double max_velocity{47.0};
};

// Wire: application_status u32, state u32, enabled_substate u32,
// offline_substate u32, curr_position f64, cmd_position f64.
struct SimpleTelemetry {
  static constexpr FrameId kFrameId = FrameId::TELEMETRY;
  static constexpr size_t kWireSize = 32;

  uint32_t application_status{0};
  ControllerState state{ControllerState::STANDBY};
  EnabledSubstate enabled_substate{EnabledSubstate::NONE};
  OfflineSubstate offline_substate{OfflineSubstate::NONE};
  double curr_position{0.0};
  double cmd_position{0.0};
};

// Return false if the span has the wrong size.
bool encode_payload(std::span<uint8_t> out, const SimpleConfig& c) noexcept;
bool decode_payload(std::span<const uint8_t> in, SimpleConfig& out) noexcept;
bool encode_payload(std::span<uint8_t> out, const SimpleTelemetry& t) noexcept;
bool decode_payload(std::span<const uint8_t> in, SimpleTelemetry& out) noexcept;

using SimpleClient = CommandTelemetryClient<SimpleConfig, SimpleTelemetry>;

} // namespace hexrot
