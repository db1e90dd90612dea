#include "hostprep/host/clock.hpp"

#include <thread>

namespace hostprep::host {

Clock::time_point SystemClock::now() const {
    return std::chrono::steady_clock::now();
}

void SystemClock::sleep_for(duration interval) {
    std::this_thread::sleep_for(interval);
}

}  // namespace hostprep::host
