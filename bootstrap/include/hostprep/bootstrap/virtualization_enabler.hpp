#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "hostprep/bootstrap/run_state.hpp"
#include "hostprep/bootstrap/self_stager.hpp"
#include "hostprep/config/config_types.hpp"

namespace hostprep::host {
class HostEnvironment;
}

namespace hostprep::logging {
class JsonLogger;
}

namespace hostprep::bootstrap {

class ContinuationGuard;
class LogonResumeEntry;

enum class VirtualizationResult {
    Ready,
    RebootScheduled,
};

struct FeatureStatus {
    std::string name;
    FeatureState state{FeatureState::Disabled};
};

// Reads the "State : ..." line of `dism /Get-FeatureInfo` output (English locale).
// Anything unrecognised counts as disabled.
FeatureState parse_feature_state(std::string_view dism_output);

class VirtualizationEnabler {
public:
    VirtualizationEnabler(const config::ProfileConfig& profile,
                          host::HostEnvironment& host,
                          const ContinuationGuard& guard,
                          LogonResumeEntry& resume_entry,
                          SelfStager& stager,
                          logging::JsonLogger& logger);

    // A failing or hanging query reports Disabled.
    std::vector<FeatureStatus> query_features();

    // Throws BootstrapError(FeatureEnableFailure | RestartFailure | StateWriteFailure).
    VirtualizationResult ensure_virtualization(const HandoffArguments& arguments);
    VirtualizationResult schedule_resume_and_restart(const HandoffArguments& arguments);

private:
    FeatureState query_feature(const std::string& feature);
    void enable_feature(const std::string& feature);

    const config::ProfileConfig& profile_;
    host::HostEnvironment& host_;
    const ContinuationGuard& guard_;
    LogonResumeEntry& resume_entry_;
    SelfStager& stager_;
    logging::JsonLogger& logger_;
};

}  // namespace hostprep::bootstrap
