#pragma once

#include <cstdint>

namespace core
{

  // TAI time split the way it travels in a frame header
  struct TaiTime
  {
    int64_t sec{0};
    int64_t nsec{0};
  };

  [[nodiscard]] constexpr double to_seconds(const TaiTime &t) noexcept
  {
    return static_cast<double>(t.sec) + static_cast<double>(t.nsec) * 1e-9;
  }

} // namespace core
