#include "hostprep/bootstrap/errors.hpp"

namespace hostprep::bootstrap {

BootstrapError::BootstrapError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PrerequisiteMissing:
            return "prerequisite-missing";
        case ErrorKind::InstallFailure:
            return "install-failure";
        case ErrorKind::FeatureEnableFailure:
            return "feature-enable-failure";
        case ErrorKind::TimeoutFailure:
            return "timeout";
        case ErrorKind::EngineNotFound:
            return "engine-not-found";
        case ErrorKind::ElevationDeclined:
            return "elevation-declined";
        case ErrorKind::ElevationFailed:
            return "elevation-failed";
        case ErrorKind::RestartFailure:
            return "restart-failure";
        case ErrorKind::CloneFailure:
            return "clone-failure";
        case ErrorKind::TemplateMissing:
            return "template-missing";
        case ErrorKind::StackLaunchFailure:
            return "stack-launch-failure";
        case ErrorKind::StagingFailure:
            return "staging-failure";
        case ErrorKind::StateWriteFailure:
            return "state-write-failure";
        case ErrorKind::ConfigInvalid:
            return "config-invalid";
    }
    return "unknown";
}

}  // namespace hostprep::bootstrap
