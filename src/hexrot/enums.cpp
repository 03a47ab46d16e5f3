#include "hexrot/enums.hpp"

#include <array>
#include <cctype>

namespace hexrot {

std::string_view to_string(FrameId v) noexcept {
  switch (v) {
    case FrameId::COMMAND_STATUS: return "COMMAND_STATUS";
    case FrameId::CONFIG: return "CONFIG";
    case FrameId::TELEMETRY: return "TELEMETRY";
  }
  return "UNKNOWN";
}

std::string_view to_string(ControllerState v) noexcept {
  switch (v) {
    case ControllerState::STANDBY: return "STANDBY";
    case ControllerState::DISABLED: return "DISABLED";
    case ControllerState::ENABLED: return "ENABLED";
    case ControllerState::OFFLINE: return "OFFLINE";
    case ControllerState::FAULT: return "FAULT";
  }
  return "UNKNOWN";
}

std::string_view to_string(OfflineSubstate v) noexcept {
  switch (v) {
    case OfflineSubstate::NONE: return "NONE";
    case OfflineSubstate::PUBLISH_ONLY: return "PUBLISH_ONLY";
    case OfflineSubstate::AVAILABLE: return "AVAILABLE";
  }
  return "UNKNOWN";
}

std::string_view to_string(EnabledSubstate v) noexcept {
  switch (v) {
    case EnabledSubstate::NONE: return "NONE";
    case EnabledSubstate::STATIONARY: return "STATIONARY";
    case EnabledSubstate::MOVING_POINT_TO_POINT: return "MOVING_POINT_TO_POINT";
  }
  return "UNKNOWN";
}

std::string_view to_string(SetStateParam v) noexcept {
  switch (v) {
    case SetStateParam::INVALID: return "INVALID";
    case SetStateParam::START: return "START";
    case SetStateParam::ENABLE: return "ENABLE";
    case SetStateParam::STANDBY: return "STANDBY";
    case SetStateParam::DISABLE: return "DISABLE";
    case SetStateParam::EXIT: return "EXIT";
    case SetStateParam::CLEAR_ERROR: return "CLEAR_ERROR";
    case SetStateParam::ENTER_CONTROL: return "ENTER_CONTROL";
  }
  return "UNKNOWN";
}

std::string_view to_string(CommandStatusCode v) noexcept {
  switch (v) {
    case CommandStatusCode::ACK: return "ACK";
    case CommandStatusCode::NO_ACK: return "NO_ACK";
  }
  return "UNKNOWN";
}

std::string_view to_string(Commander v) noexcept {
  switch (v) {
    case Commander::GUI: return "GUI";
    case Commander::CSC: return "CSC";
  }
  return "UNKNOWN";
}

static bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::toupper(static_cast<unsigned char>(a[i])) !=
        std::toupper(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

bool parse_controller_state(std::string_view name, ControllerState& out) noexcept {
  static constexpr std::array<ControllerState, 5> kAll{
    ControllerState::STANDBY, ControllerState::DISABLED, ControllerState::ENABLED,
    ControllerState::OFFLINE, ControllerState::FAULT};
  for (auto s : kAll) {
    if (iequals(name, to_string(s))) {
      out = s;
      return true;
    }
  }
  return false;
}

} // namespace hexrot
