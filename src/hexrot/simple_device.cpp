#include "hexrot/simple_device.hpp"

#include "connection/wire_codec.hpp"

namespace hexrot {

using namespace connection::wire;

std::string_view to_string(SimpleCommandCode v) noexcept {
  switch (v) {
    case SimpleCommandCode::SET_STATE: return "SET_STATE";
    case SimpleCommandCode::SET_ENABLED_SUBSTATE: return "SET_ENABLED_SUBSTATE";
    case SimpleCommandCode::MOVE: return "MOVE";
    case SimpleCommandCode::CONFIG_VEL: return "CONFIG_VEL";
  }
  return "UNKNOWN";
}

bool encode_payload(std::span<uint8_t> out, const SimpleConfig& c) noexcept {
  if (out.size() != SimpleConfig::kWireSize) return false;
  size_t o = 0;
  write_f64_le(out.data()+o, c.min_position); o+=8;
  write_f64_le(out.data()+o, c.max_position); o+=8;
  write_f64_le(out.data()+o, c.max_velocity); o+=8;
  return (o == SimpleConfig::kWireSize);
}

bool decode_payload(std::span<const uint8_t> in, SimpleConfig& out) noexcept {
  if (in.size() != SimpleConfig::kWireSize) return false;
  size_t o = 0;
  out.min_position = read_f64_le(in.data()+o); o+=8;
  out.max_position = read_f64_le(in.data()+o); o+=8;
  out.max_velocity = read_f64_le(in.data()+o); o+=8;
  return (o == SimpleConfig::kWireSize);
}

bool encode_payload(std::span<uint8_t> out, const SimpleTelemetry& t) noexcept {
  if (out.size() != SimpleTelemetry::kWireSize) return false;
  size_t o = 0;
  write_u32_le(out.data()+o, t.application_status);           o+=4;
  write_u32_le(out.data()+o, to_underlying(t.state));          o+=4;
  write_u32_le(out.data()+o, to_underlying(t.enabled_substate)); o+=4;
  write_u32_le(out.data()+o, to_underlying(t.offline_substate)); o+=4;
  write_f64_le(out.data()+o, t.curr_position);                 o+=8;
  write_f64_le(out.data()+o, t.cmd_position);                  o+=8;
  return (o == SimpleTelemetry::kWireSize);
}

bool decode_payload(std::span<const uint8_t> in, SimpleTelemetry& out) noexcept {
  if (in.size() != SimpleTelemetry::kWireSize) return false;
  size_t o = 0;
  out.application_status = read_u32_le(in.data()+o);                         o+=4;
  out.state            = static_cast<ControllerState>(read_u32_le(in.data()+o)); o+=4;
  out.enabled_substate = static_cast<EnabledSubstate>(read_u32_le(in.data()+o)); o+=4;
  out.offline_substate = static_cast<OfflineSubstate>(read_u32_le(in.data()+o)); o+=4;
  out.curr_position = read_f64_le(in.data()+o); o+=8;
  out.cmd_position  = read_f64_le(in.data()+o); o+=8;
  return (o == SimpleTelemetry::kWireSize);
}

} // namespace hexrot
