#include "connection/wire_codec.hpp"
#include "hexrot/enums.hpp"
#include "hexrot/simple_device.hpp"
#include "hexrot/wrapping_counter.hpp"
#include "utils/timestamp.h"

#include <array>
#include <chrono>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <string>

using namespace connection::wire;

static void test_header_layout() {
  Header h{};
  h.frame_id = 0x0203;
  h.counter = 0x11223344;
  h.tai_sec = 0x0102030405060708LL;
  h.tai_nsec = -1;

  std::array<uint8_t, kHeaderSize> buf{};
  assert(encode_header(buf, h));
  // Little-endian, no padding.
  assert(buf[0] == 0x03 && buf[1] == 0x02);
  assert(buf[2] == 0x44 && buf[3] == 0x33 && buf[4] == 0x22 && buf[5] == 0x11);
  assert(buf[6] == 0x08 && buf[13] == 0x01);
  for (size_t i = 14; i < kHeaderSize; ++i) assert(buf[i] == 0xFF);

  Header out{};
  assert(decode_header(buf, out));
  assert(out.frame_id == h.frame_id);
  assert(out.counter == h.counter);
  assert(out.tai_sec == h.tai_sec);
  assert(out.tai_nsec == h.tai_nsec);

  // Wrong span size is refused.
  std::array<uint8_t, kHeaderSize - 1> short_buf{};
  assert(!encode_header(short_buf, h));
  assert(!decode_header(short_buf, out));
}

static void test_command_layout() {
  Command c{};
  c.commander = 2;
  c.counter = 7;
  c.code = 3;
  c.param = {1.5, -2.0, 0.0, 1e300, -0.0, 42.0};

  std::array<uint8_t, kCommandSize> buf{};
  assert(encode_command(buf, c));
  assert(buf[0] == 2 && buf[4] == 7 && buf[8] == 3);

  double p1 = 0.0;
  uint64_t bits = read_u64_le(buf.data() + 12);
  std::memcpy(&p1, &bits, sizeof(p1));
  assert(p1 == 1.5);

  Command out{};
  assert(decode_command(buf, out));
  assert(out.commander == c.commander);
  assert(out.counter == c.counter);
  assert(out.code == c.code);
  for (size_t i = 0; i < kNumCommandParams; ++i) {
    assert(std::memcmp(&out.param[i], &c.param[i], sizeof(double)) == 0);
  }
  assert(out.param1() == 1.5);
}

static void test_command_status_reason() {
  CommandStatus s{};
  s.status = 2;
  s.duration = 0.25;
  s.reason = "bad state";

  std::array<uint8_t, kCommandStatusSize> buf{};
  assert(encode_command_status(buf, s));
  // Reason is NUL padded to its full capacity.
  for (size_t i = 12 + s.reason.size(); i < kCommandStatusSize; ++i) assert(buf[i] == 0);

  CommandStatus out{};
  assert(decode_command_status(buf, out));
  assert(out.status == 2);
  assert(out.duration == 0.25);
  assert(out.reason == "bad state");

  // Longer text is cut to exactly the buffer capacity.
  const std::string long_reason(kReasonSize + 20, 'x');
  s.reason = long_reason;
  assert(encode_command_status(buf, s));
  assert(decode_command_status(buf, out));
  assert(out.reason.size() == kReasonSize);
  assert(out.reason == long_reason.substr(0, kReasonSize));

  // Exactly full buffer has no terminator and still decodes.
  s.reason = std::string(kReasonSize, 'y');
  assert(encode_command_status(buf, s));
  assert(decode_command_status(buf, out));
  assert(out.reason == s.reason);

  const auto packed = pack_reason("");
  for (auto b : packed) assert(b == 0);
}

static void test_simple_records() {
  hexrot::SimpleConfig c{};
  c.min_position = -10.0;
  c.max_position = 12.5;
  c.max_velocity = 3.0;
  std::array<uint8_t, hexrot::SimpleConfig::kWireSize> cbuf{};
  assert(hexrot::encode_payload(cbuf, c));
  hexrot::SimpleConfig c_out{};
  assert(hexrot::decode_payload(cbuf, c_out));
  assert(c_out.min_position == -10.0 && c_out.max_position == 12.5 && c_out.max_velocity == 3.0);

  hexrot::SimpleTelemetry t{};
  t.application_status = hexrot::DDS_COMMAND_SOURCE;
  t.state = hexrot::ControllerState::ENABLED;
  t.enabled_substate = hexrot::EnabledSubstate::STATIONARY;
  t.offline_substate = hexrot::OfflineSubstate::NONE;
  t.curr_position = 1.001;
  t.cmd_position = 1.0;
  std::array<uint8_t, hexrot::SimpleTelemetry::kWireSize> tbuf{};
  assert(hexrot::encode_payload(tbuf, t));
  assert(read_u32_le(tbuf.data()) == 0x400);
  assert(read_u32_le(tbuf.data() + 4) == 2);
  assert(read_u32_le(tbuf.data() + 8) == 1);

  hexrot::SimpleTelemetry tout{};
  assert(hexrot::decode_payload(tbuf, tout));
  assert(tout.state == hexrot::ControllerState::ENABLED);
  assert(tout.enabled_substate == hexrot::EnabledSubstate::STATIONARY);
  assert(tout.curr_position == 1.001 && tout.cmd_position == 1.0);

  std::array<uint8_t, 8> wrong{};
  assert(!hexrot::decode_payload(wrong, tout));
}

static void test_wrapping_counter() {
  hexrot::WrappingCounter<uint8_t> c8(254);
  assert(c8.next() == 254);
  assert(c8.next() == 255);
  assert(c8.next() == 0);
  assert(c8.peek() == 1);

  hexrot::WrappingCounter<uint32_t> c32(0xFFFFFFFFu);
  assert(c32.next() == 0xFFFFFFFFu);
  assert(c32.next() == 0u);

  hexrot::WrappingCounter<> c;
  for (uint32_t i = 0; i < 5; ++i) assert(c.next() == i);
  c.reset();
  assert(c.next() == 0);
}

static void test_enums() {
  assert(hexrot::to_string(hexrot::ControllerState::OFFLINE) == "OFFLINE");
  assert(hexrot::to_string(hexrot::SetStateParam::ENTER_CONTROL) == "ENTER_CONTROL");
  assert(hexrot::to_string(hexrot::SimpleCommandCode::CONFIG_VEL) == "CONFIG_VEL");
  assert(hexrot::to_string(static_cast<hexrot::ControllerState>(99)) == "UNKNOWN");

  hexrot::ControllerState s{};
  assert(hexrot::parse_controller_state("standby", s) && s == hexrot::ControllerState::STANDBY);
  assert(hexrot::parse_controller_state("FAULT", s) && s == hexrot::ControllerState::FAULT);
  assert(!hexrot::parse_controller_state("moving", s));
}

static void test_tai_stamp() {
  const auto tai = utils::tai_now();
  assert(tai.nsec >= 0 && tai.nsec < 1'000'000'000);
  const double utc = std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
  const double diff = core::to_seconds(tai) - utc;
  assert(diff > utils::kTaiMinusUtc - 1.0 && diff < utils::kTaiMinusUtc + 1.0);
}

int main() {
  test_header_layout();
  test_command_layout();
  test_command_status_reason();
  test_simple_records();
  test_wrapping_counter();
  test_enums();
  test_tai_stamp();
  return 0;
}
