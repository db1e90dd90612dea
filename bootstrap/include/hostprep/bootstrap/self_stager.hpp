#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "hostprep/config/config_types.hpp"

namespace hostprep::host {
class HostEnvironment;
}

namespace hostprep::logging {
class JsonLogger;
}

namespace hostprep::bootstrap {

struct StagedCopy {
    std::filesystem::path executable;
    // Empty when the run uses built-in defaults.
    std::filesystem::path profile;
};

// What a relaunched instance must be told to behave like the current one.
struct HandoffArguments {
    std::filesystem::path profile;
    std::filesystem::path log_override;
};

std::vector<std::string> build_handoff_arguments(const StagedCopy& staged,
                                                 const HandoffArguments& arguments,
                                                 bool resumed);

// Keeps a copy of the running executable under the user's temp directory so the
// elevated instance and the post-reboot resume never depend on the download location.
class SelfStager {
public:
    SelfStager(const config::ContinuationConfig& config,
               host::HostEnvironment& host,
               logging::JsonLogger& logger);

    [[nodiscard]] std::filesystem::path stage_directory() const;
    [[nodiscard]] std::filesystem::path staged_executable() const;
    [[nodiscard]] std::filesystem::path staged_profile() const;

    // Throws BootstrapError(StagingFailure).
    StagedCopy ensure_staged(const std::filesystem::path& profile);

private:
    const config::ContinuationConfig& config_;
    host::HostEnvironment& host_;
    logging::JsonLogger& logger_;
};

}  // namespace hostprep::bootstrap
