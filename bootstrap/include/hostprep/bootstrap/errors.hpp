#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace hostprep::bootstrap {

enum class ErrorKind {
    PrerequisiteMissing,
    InstallFailure,
    FeatureEnableFailure,
    TimeoutFailure,
    EngineNotFound,
    ElevationDeclined,
    ElevationFailed,
    RestartFailure,
    CloneFailure,
    TemplateMissing,
    StackLaunchFailure,
    StagingFailure,
    StateWriteFailure,
    ConfigInvalid,
};

std::string_view error_kind_name(ErrorKind kind);

// Fatal bootstrap condition. Nothing is rolled back; rerunning is the recovery.
class BootstrapError : public std::runtime_error {
public:
    BootstrapError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace hostprep::bootstrap
