#pragma once

#include <chrono>
#include <cstddef>
#include <functional>

#include "hostprep/host/clock.hpp"

namespace hostprep::logging {
class JsonLogger;
}

namespace hostprep::bootstrap {

struct PollOutcome {
    std::size_t attempts{0};
    host::Clock::duration elapsed{};
};

// Fixed-interval polling with a hard ceiling, no backoff.
class ReadinessPoller {
public:
    ReadinessPoller(host::Clock& clock,
                    std::chrono::seconds interval,
                    std::chrono::seconds budget,
                    logging::JsonLogger* logger = nullptr);

    // Throws BootstrapError(TimeoutFailure) once the budget is spent.
    PollOutcome wait_until_ready(const std::function<bool()>& probe);

private:
    host::Clock& clock_;
    std::chrono::seconds interval_;
    std::chrono::seconds budget_;
    logging::JsonLogger* logger_{nullptr};
};

}  // namespace hostprep::bootstrap
