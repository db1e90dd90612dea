#include "hostprep/bootstrap/readiness_poller.hpp"

#include <nlohmann/json.hpp>

#include "hostprep/bootstrap/errors.hpp"
#include "hostprep/logging/json_logger.hpp"

namespace hostprep::bootstrap {

namespace {

long long to_seconds(host::Clock::duration value) {
    return std::chrono::duration_cast<std::chrono::seconds>(value).count();
}

}  // namespace

ReadinessPoller::ReadinessPoller(host::Clock& clock,
                                 std::chrono::seconds interval,
                                 std::chrono::seconds budget,
                                 logging::JsonLogger* logger)
    : clock_(clock), interval_(interval), budget_(budget), logger_(logger) {}

PollOutcome ReadinessPoller::wait_until_ready(const std::function<bool()>& probe) {
    const auto started = clock_.now();
    PollOutcome outcome{};

    for (;;) {
        ++outcome.attempts;
        const bool ready = probe();
        outcome.elapsed = clock_.now() - started;

        if (logger_) {
            logger_->event("engine.poll", {
                {"attempt", outcome.attempts},
                {"ready", ready},
                {"elapsed_s", to_seconds(outcome.elapsed)}
            });
        }
        if (ready) {
            return outcome;
        }
        if (outcome.elapsed >= budget_) {
            throw BootstrapError(ErrorKind::TimeoutFailure,
                                 "Container engine failed to start within " +
                                     std::to_string(budget_.count()) + " seconds");
        }
        clock_.sleep_for(interval_);
    }
}

}  // namespace hostprep::bootstrap
