#pragma once
#include <concepts>
#include <cstdint>

namespace hexrot {

/**
 * @brief Unsigned counter with modular (2^bits) wraparound.
 *
 * next() hands out the current value and advances by one; after the maximum
 * value it continues at 0. Not thread-safe: the owner serializes access.
 */
template <std::unsigned_integral UInt = uint32_t>
class WrappingCounter {
public:
  using value_type = UInt;

  constexpr explicit WrappingCounter(UInt origin = 0) noexcept : value_(origin) {}

  constexpr UInt next() noexcept {
    const UInt v = value_;
    value_ = static_cast<UInt>(value_ + 1u);
    return v;
  }

  /// Value the next call to next() will return.
  [[nodiscard]] constexpr UInt peek() const noexcept { return value_; }

  constexpr void reset(UInt origin = 0) noexcept { value_ = origin; }

private:
  UInt value_;
};

} // namespace hexrot
