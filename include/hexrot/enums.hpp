#pragma once
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace hexrot {

// Discriminator carried by every controller -> link frame header.
enum class FrameId : uint16_t {
  COMMAND_STATUS = 1,
  CONFIG = 2,
  TELEMETRY = 3,
};

enum class ControllerState : uint32_t {
  STANDBY = 0,
  DISABLED = 1,
  ENABLED = 2,
  OFFLINE = 3,
  FAULT = 4,
};

enum class OfflineSubstate : uint32_t {
  NONE = 0,
  PUBLISH_ONLY = 1,
  AVAILABLE = 2,
};

enum class EnabledSubstate : uint32_t {
  NONE = 0,
  STATIONARY = 1,
  MOVING_POINT_TO_POINT = 2,
};

// Command.param1 of a SET_STATE command.
enum class SetStateParam : uint32_t {
  INVALID = 0,
  START = 1,
  ENABLE = 2,
  STANDBY = 3,
  DISABLE = 4,
  EXIT = 5,
  CLEAR_ERROR = 6,
  ENTER_CONTROL = 7,
};

enum class CommandStatusCode : uint32_t {
  ACK = 1,
  NO_ACK = 2,
};

// Command.commander: who sent the command.
enum class Commander : uint32_t {
  GUI = 1,
  CSC = 2,
};

// ApplicationStatus bits reported in telemetry.
inline constexpr uint32_t DDS_COMMAND_SOURCE = 0x400;

std::string_view to_string(FrameId v) noexcept;
std::string_view to_string(ControllerState v) noexcept;
std::string_view to_string(OfflineSubstate v) noexcept;
std::string_view to_string(EnabledSubstate v) noexcept;
std::string_view to_string(SetStateParam v) noexcept;
std::string_view to_string(CommandStatusCode v) noexcept;
std::string_view to_string(Commander v) noexcept;

// Name -> ControllerState ("offline", "STANDBY", ...); false if unknown.
[[nodiscard]] bool parse_controller_state(std::string_view name, ControllerState& out) noexcept;

template <typename E>
constexpr auto to_underlying(E e) noexcept {
  return static_cast<std::underlying_type_t<E>>(e);
}

} // namespace hexrot
