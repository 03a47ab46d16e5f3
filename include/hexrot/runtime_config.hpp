#pragma once
#include "hexrot/enums.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace hexrot {

using Seconds = std::chrono::duration<double>;

// Settings of the link (the side that sends commands).
struct ClientConfig {
  // Networking
  std::string host{"127.0.0.1"};
  uint16_t port{5570};

  // Timeouts
  Seconds connect_timeout{10.0};
  Seconds connect_retry_interval{0.1};
  Seconds command_timeout{5.0};

  // Stamped into every Command.
  Commander commander{Commander::CSC};
  // Counter of the first Command; later ones count up and wrap at 2^32.
  uint32_t first_command_counter{0};
};

// Settings of a mock controller (the side that accepts the link).
struct MockConfig {
  std::string host{"127.0.0.1"};
  uint16_t port{0}; // 0 = ephemeral

  ControllerState initial_state{ControllerState::OFFLINE};
  Seconds telemetry_interval{0.1};
};

} // namespace hexrot
