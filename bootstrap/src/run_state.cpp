#include "hostprep/bootstrap/run_state.hpp"

#include <algorithm>

namespace hostprep::bootstrap {

RunState derive_run_state(const HostFacts& facts) {
    if (!facts.elevated) {
        return RunState::Unprivileged;
    }
    if (facts.marker_present) {
        return RunState::Ready;
    }
    if (!facts.package_manager_present.value_or(false) || !facts.tools_present.value_or(false)) {
        return RunState::NeedsPrerequisites;
    }

    const auto count = [&facts](FeatureState state) {
        return std::count(facts.features.begin(), facts.features.end(), state);
    };
    if (!facts.features.empty() && count(FeatureState::Disabled) == 0 &&
        count(FeatureState::EnablePending) > 0) {
        return RunState::PendingReboot;
    }
    // Fully enabled hosts land here too; the enabler confirms and writes the marker.
    return RunState::NeedsVirtualization;
}

std::string_view run_state_name(RunState state) {
    switch (state) {
        case RunState::Unprivileged:
            return "unprivileged";
        case RunState::NeedsPrerequisites:
            return "needs-prerequisites";
        case RunState::NeedsVirtualization:
            return "needs-virtualization";
        case RunState::PendingReboot:
            return "pending-reboot";
        case RunState::Ready:
            return "ready";
    }
    return "unknown";
}

std::string_view feature_state_name(FeatureState state) {
    switch (state) {
        case FeatureState::Enabled:
            return "enabled";
        case FeatureState::EnablePending:
            return "enable-pending";
        case FeatureState::Disabled:
            return "disabled";
    }
    return "unknown";
}

}  // namespace hostprep::bootstrap
