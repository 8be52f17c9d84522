#include "clock.hpp"

#include <chrono>
#include <thread>

namespace aiu {

double SteadyClock::now_ms() const {
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration<double, std::milli>(now).count();
}

void SteadyClock::sleep_for_ms(double ms) {
    if (ms <= 0) return;
    std::this_thread::sleep_for(std::chrono::duration<double, std::milli>(ms));
}

Clock& default_clock() {
    static SteadyClock clock;
    return clock;
}

} // namespace aiu
