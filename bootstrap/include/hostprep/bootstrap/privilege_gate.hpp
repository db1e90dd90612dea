#pragma once

#include "hostprep/bootstrap/self_stager.hpp"

namespace hostprep::host {
class HostEnvironment;
}

namespace hostprep::logging {
class JsonLogger;
}

namespace hostprep::bootstrap {

enum class GateResult {
    Elevated,
    Relaunched,
};

// Nothing is done unprivileged: a non-elevated invocation stages itself,
// hands off to an elevated copy and ends.
class PrivilegeGate {
public:
    PrivilegeGate(host::HostEnvironment& host, SelfStager& stager, logging::JsonLogger& logger);

    // Throws BootstrapError(ElevationDeclined | ElevationFailed | StagingFailure).
    GateResult run_with_elevation(const HandoffArguments& arguments, bool resumed);

private:
    host::HostEnvironment& host_;
    SelfStager& stager_;
    logging::JsonLogger& logger_;
};

}  // namespace hostprep::bootstrap
