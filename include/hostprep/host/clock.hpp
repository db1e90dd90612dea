#pragma once

#include <chrono>

namespace hostprep::host {

class Clock {
public:
    using duration = std::chrono::steady_clock::duration;
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;
    virtual void sleep_for(duration interval) = 0;
};

class SystemClock final : public Clock {
public:
    time_point now() const override;
    void sleep_for(duration interval) override;
};

}  // namespace hostprep::host
