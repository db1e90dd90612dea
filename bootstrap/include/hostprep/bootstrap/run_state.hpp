#pragma once

#include <optional>
#include <string_view>
#include <vector>

namespace hostprep::bootstrap {

enum class RunState {
    Unprivileged,
    NeedsPrerequisites,
    NeedsVirtualization,
    PendingReboot,
    Ready,
};

enum class FeatureState {
    Enabled,
    EnablePending,
    Disabled,
};

// Observable host facts. Later facts are only probed when the earlier ones do
// not already decide the state, so they stay empty in that case.
struct HostFacts {
    bool elevated{false};
    bool marker_present{false};
    std::optional<bool> package_manager_present;
    std::optional<bool> tools_present;
    std::vector<FeatureState> features;
};

RunState derive_run_state(const HostFacts& facts);

std::string_view run_state_name(RunState state);
std::string_view feature_state_name(FeatureState state);

}  // namespace hostprep::bootstrap
