#include "core/Clock.hpp"
#include <chrono>

namespace securewatch {

uint64_t SystemClock::NowMs() const {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
    return static_cast<uint64_t>(ms.count());
}

} // namespace securewatch
