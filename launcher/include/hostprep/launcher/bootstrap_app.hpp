#pragma once

#include <filesystem>

#include "hostprep/bootstrap/run_state.hpp"
#include "hostprep/cli/cli_options.hpp"
#include "hostprep/config/config_loader.hpp"
#include "hostprep/config/config_types.hpp"

namespace hostprep::host {
class Clock;
class HostEnvironment;
}

namespace hostprep::bootstrap {
class ContinuationGuard;
class PrerequisiteInstaller;
class VirtualizationEnabler;
}

namespace hostprep::launcher {

// One invocation of the bootstrap. The process is re-entered after the
// elevation handoff and after every restart; each entry derives where to
// continue from host facts alone.
class BootstrapApp {
public:
    BootstrapApp(host::HostEnvironment& host, host::Clock& clock);

    // Returns the process exit code: 0 on success or intentional handoff, 1 on failure.
    int run(const cli::Options& options);

private:
    std::filesystem::path resolve_profile(const cli::Options& options) const;
    std::filesystem::path default_log_path(const config::ProfileConfig& profile) const;
    bootstrap::RunState probe_state(const bootstrap::ContinuationGuard& guard,
                                    const bootstrap::PrerequisiteInstaller& installer,
                                    bootstrap::VirtualizationEnabler& enabler) const;
    static void print_plan(const config::ConfigLoader::ValidationResult& plan,
                           const std::filesystem::path& source);

    host::HostEnvironment& host_;
    host::Clock& clock_;
};

}  // namespace hostprep::launcher
