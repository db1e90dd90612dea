#include "hostprep/bootstrap/privilege_gate.hpp"

#include <nlohmann/json.hpp>

#include "hostprep/bootstrap/errors.hpp"
#include "hostprep/host/host_environment.hpp"
#include "hostprep/logging/json_logger.hpp"

namespace hostprep::bootstrap {

PrivilegeGate::PrivilegeGate(host::HostEnvironment& host, SelfStager& stager, logging::JsonLogger& logger)
    : host_(host), stager_(stager), logger_(logger) {}

GateResult PrivilegeGate::run_with_elevation(const HandoffArguments& arguments, bool resumed) {
    if (host_.is_elevated()) {
        return GateResult::Elevated;
    }

    const StagedCopy staged = stager_.ensure_staged(arguments.profile);
    const std::vector<std::string> forwarded = build_handoff_arguments(staged, arguments, resumed);

    std::string error;
    const host::ElevationOutcome outcome = host_.relaunch_elevated(staged.executable, forwarded, error);
    switch (outcome) {
        case host::ElevationOutcome::Started:
            logger_.event("privilege.relaunch", {
                {"executable", host::path_to_utf8(staged.executable)},
                {"arguments", forwarded}
            });
            return GateResult::Relaunched;
        case host::ElevationOutcome::Declined:
            throw BootstrapError(ErrorKind::ElevationDeclined,
                                 "Administrator rights were declined; nothing was changed. "
                                 "Run hostprep again and accept the prompt.");
        case host::ElevationOutcome::Failed:
            break;
    }
    throw BootstrapError(ErrorKind::ElevationFailed, "Cannot start an elevated instance: " + error);
}

}  // namespace hostprep::bootstrap
