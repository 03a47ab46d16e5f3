#pragma once
#include "hexrot/base_mock_controller.hpp"
#include "hexrot/simple_device.hpp"

namespace hexrot {

/**
 * @brief Mock of the simple single-axis device.
 *
 * MOVE sets cmd_position and curr_position (rejected outside the configured
 * limits); CONFIG_VEL sets max_velocity and re-sends the Config frame. Every
 * telemetry tick curr_position creeps by 0.001.
 */
class SimpleMockController final : public BaseMockController {
public:
  explicit SimpleMockController(MockConfig cfg = {});
  ~SimpleMockController() noexcept override;

  [[nodiscard]] SimpleConfig config() const;
  [[nodiscard]] SimpleTelemetry telemetry() const;

protected:
  size_t config_size() const noexcept override { return SimpleConfig::kWireSize; }
  size_t telemetry_size() const noexcept override { return SimpleTelemetry::kWireSize; }
  void encode_config(std::span<uint8_t> out) const override;
  void encode_telemetry(std::span<uint8_t> out) const override;
  void update_telemetry() override;

private:
  double do_move(const connection::wire::Command& cmd);
  double do_config_velocity(const connection::wire::Command& cmd);
  SimpleTelemetry snapshot_locked() const;

  SimpleConfig config_;
  SimpleTelemetry telemetry_;
};

} // namespace hexrot
