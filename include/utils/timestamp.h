#pragma once
#include "core/basic.hpp"

namespace utils {

// TAI - UTC, in seconds (valid since 2017-01-01).
inline constexpr int kTaiMinusUtc = 37;

/**
 * @brief Get monotonic timestamp in seconds
 */
[[nodiscard]] double monotonic_now() noexcept;

/**
 * @brief Current TAI time, as written into frame headers
 */
[[nodiscard]] core::TaiTime tai_now() noexcept;

} // namespace utils
