#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace connection::wire {

/**
 * @brief Wire format utilities for the controller command/telemetry protocol.
 *
 * IMPORTANT:
 * - The wire format is explicitly defined as LITTLE-ENDIAN for all multi-byte fields.
 * - Doubles are IEEE-754 binary64, transmitted as their raw uint64 bit pattern (little-endian).
 * - Records are encoded field by field, so the byte layout never depends on
 *   C/C++ struct packing/alignment.
 *
 * Controller -> link: Header followed by one payload (CommandStatus, Config, Telemetry).
 * Link -> controller: bare Command records.
 */

// ---- Fixed record sizes (bytes) ----
inline constexpr size_t kHeaderSize        = 22; // frame_id(u16) + counter(u32) + tai_sec(i64) + tai_nsec(i64)
inline constexpr size_t kCommandSize       = 60; // commander(u32) + counter(u32) + code(u32) + 6*f64
inline constexpr size_t kReasonSize        = 50; // fixed capacity of CommandStatus::reason
inline constexpr size_t kCommandStatusSize = 12 + kReasonSize; // status(u32) + duration(f64) + reason

inline constexpr size_t kNumCommandParams = 6;

// ---- Endian helpers ----
inline void write_u16_le(uint8_t* out, uint16_t v) noexcept {
  out[0] = static_cast<uint8_t>(v & 0xFF);
  out[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
}

inline void write_u32_le(uint8_t* out, uint32_t v) noexcept {
  out[0] = static_cast<uint8_t>(v & 0xFF);
  out[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
  out[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
  out[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}

inline void write_u64_le(uint8_t* out, uint64_t v) noexcept {
  write_u32_le(out, static_cast<uint32_t>(v & 0xFFFFFFFFull));
  write_u32_le(out + 4, static_cast<uint32_t>(v >> 32));
}

inline uint16_t read_u16_le(const uint8_t* in) noexcept {
  return static_cast<uint16_t>(static_cast<uint16_t>(in[0]) |
                               (static_cast<uint16_t>(in[1]) << 8));
}

inline uint32_t read_u32_le(const uint8_t* in) noexcept {
  return static_cast<uint32_t>(static_cast<uint32_t>(in[0]) |
                               (static_cast<uint32_t>(in[1]) << 8) |
                               (static_cast<uint32_t>(in[2]) << 16) |
                               (static_cast<uint32_t>(in[3]) << 24));
}

inline uint64_t read_u64_le(const uint8_t* in) noexcept {
  return static_cast<uint64_t>(read_u32_le(in)) |
         (static_cast<uint64_t>(read_u32_le(in + 4)) << 32);
}

inline void write_i64_le(uint8_t* out, int64_t v) noexcept {
  write_u64_le(out, static_cast<uint64_t>(v));
}

inline int64_t read_i64_le(const uint8_t* in) noexcept {
  return static_cast<int64_t>(read_u64_le(in));
}

inline void write_f64_le(uint8_t* out, double f) noexcept {
  write_u64_le(out, std::bit_cast<uint64_t>(f));
}

inline double read_f64_le(const uint8_t* in) noexcept {
  return std::bit_cast<double>(read_u64_le(in));
}

// ---- Logical records (independent of layout/padding) ----
struct Header {
  uint16_t frame_id{0};
  uint32_t counter{0};
  int64_t  tai_sec{0};
  int64_t  tai_nsec{0};
};

struct Command {
  uint32_t commander{0};
  uint32_t counter{0};
  uint32_t code{0};
  std::array<double, kNumCommandParams> param{};

  // param1..param6 in protocol terms
  double& param1() noexcept { return param[0]; }
  double param1() const noexcept { return param[0]; }
};

struct CommandStatus {
  uint32_t status{0};   // 1 = ACK, 2 = NO_ACK
  double   duration{0.0};
  std::string reason;   // at most kReasonSize bytes once encoded
};

// Copy `text` into a kReasonSize buffer, truncating and NUL padding.
std::array<uint8_t, kReasonSize> pack_reason(std::string_view text) noexcept;
// Text up to the first NUL (or the whole buffer when full).
std::string unpack_reason(std::span<const uint8_t> buf);

// ---- Encoders / decoders (return false if span has wrong size) ----
bool encode_header(std::span<uint8_t> out, const Header& h) noexcept;
bool decode_header(std::span<const uint8_t> in, Header& out) noexcept;

bool encode_command(std::span<uint8_t> out, const Command& c) noexcept;
bool decode_command(std::span<const uint8_t> in, Command& out) noexcept;

bool encode_command_status(std::span<uint8_t> out, const CommandStatus& s) noexcept;
bool decode_command_status(std::span<const uint8_t> in, CommandStatus& out);

} // namespace connection::wire
