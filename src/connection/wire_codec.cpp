#include "connection/wire_codec.hpp"

#include <algorithm>

namespace connection::wire {

std::array<uint8_t, kReasonSize> pack_reason(std::string_view text) noexcept {
  std::array<uint8_t, kReasonSize> buf{};
  const size_t n = std::min(text.size(), kReasonSize);
  for (size_t i = 0; i < n; ++i) buf[i] = static_cast<uint8_t>(text[i]);
  return buf;
}

std::string unpack_reason(std::span<const uint8_t> buf) {
  const size_t n = std::min(buf.size(), kReasonSize);
  size_t len = 0;
  while (len < n && buf[len] != 0) ++len;
  return std::string(reinterpret_cast<const char*>(buf.data()), len);
}

bool encode_header(std::span<uint8_t> out, const Header& h) noexcept {
  if (out.size() != kHeaderSize) return false;
  size_t o = 0;
  write_u16_le(out.data()+o, h.frame_id); o+=2;
  write_u32_le(out.data()+o, h.counter);  o+=4;
  write_i64_le(out.data()+o, h.tai_sec);  o+=8;
  write_i64_le(out.data()+o, h.tai_nsec); o+=8;
  return (o == kHeaderSize);
}

bool decode_header(std::span<const uint8_t> in, Header& out) noexcept {
  if (in.size() != kHeaderSize) return false;
  size_t o = 0;
  out.frame_id = read_u16_le(in.data()+o); o+=2;
  out.counter  = read_u32_le(in.data()+o); o+=4;
  out.tai_sec  = read_i64_le(in.data()+o); o+=8;
  out.tai_nsec = read_i64_le(in.data()+o); o+=8;
  return (o == kHeaderSize);
}

bool encode_command(std::span<uint8_t> out, const Command& c) noexcept {
  if (out.size() != kCommandSize) return false;
  size_t o = 0;
  write_u32_le(out.data()+o, c.commander); o+=4;
  write_u32_le(out.data()+o, c.counter);   o+=4;
  write_u32_le(out.data()+o, c.code);      o+=4;
  for (double p : c.param) { write_f64_le(out.data()+o, p); o+=8; }
  return (o == kCommandSize);
}

bool decode_command(std::span<const uint8_t> in, Command& out) noexcept {
  if (in.size() != kCommandSize) return false;
  size_t o = 0;
  out.commander = read_u32_le(in.data()+o); o+=4;
  out.counter   = read_u32_le(in.data()+o); o+=4;
  out.code      = read_u32_le(in.data()+o); o+=4;
  for (double& p : out.param) { p = read_f64_le(in.data()+o); o+=8; }
  return (o == kCommandSize);
}

bool encode_command_status(std::span<uint8_t> out, const CommandStatus& s) noexcept {
  if (out.size() != kCommandStatusSize) return false;
  size_t o = 0;
  write_u32_le(out.data()+o, s.status);   o+=4;
  write_f64_le(out.data()+o, s.duration); o+=8;
  const auto reason = pack_reason(s.reason);
  std::copy(reason.begin(), reason.end(), out.begin() + static_cast<std::ptrdiff_t>(o));
  o += kReasonSize;
  return (o == kCommandStatusSize);
}

bool decode_command_status(std::span<const uint8_t> in, CommandStatus& out) {
  if (in.size() != kCommandStatusSize) return false;
  size_t o = 0;
  out.status   = read_u32_le(in.data()+o); o+=4;
  out.duration = read_f64_le(in.data()+o); o+=8;
  out.reason   = unpack_reason(in.subspan(o, kReasonSize));
  o += kReasonSize;
  return (o == kCommandStatusSize);
}

} // namespace connection::wire
