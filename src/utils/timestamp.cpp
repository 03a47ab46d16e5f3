#include "utils/timestamp.h"
#include <chrono>

namespace utils {

double monotonic_now() noexcept {
    using namespace std::chrono;
    static const steady_clock::time_point t0 = steady_clock::now();
    return duration_cast<std::chrono::duration<double>>(
        steady_clock::now() - t0
    ).count();
}

core::TaiTime tai_now() noexcept {
    using namespace std::chrono;
    const auto ns = duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count();
    return {
        .sec = ns / 1'000'000'000 + kTaiMinusUtc,
        .nsec = ns % 1'000'000'000
    };
}

} // namespace utils
