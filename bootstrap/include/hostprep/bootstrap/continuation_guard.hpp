#pragma once

#include <filesystem>
#include <string>

#include "hostprep/config/config_types.hpp"

namespace hostprep::host {
class HostEnvironment;
}

namespace hostprep::bootstrap {

// Presence of the marker file means prerequisites and virtualization were
// already confirmed; its content is irrelevant.
class ContinuationGuard {
public:
    explicit ContinuationGuard(std::filesystem::path marker);

    static ContinuationGuard for_host(const config::ContinuationConfig& config,
                                      const host::HostEnvironment& host);

    [[nodiscard]] bool should_run_setup_phase() const;
    // Idempotent. Throws BootstrapError(StateWriteFailure).
    void mark_complete() const;

    [[nodiscard]] const std::filesystem::path& marker_path() const { return marker_; }

private:
    std::filesystem::path marker_;
};

// The per-user run-on-logon value that resumes the bootstrap after a restart.
class LogonResumeEntry {
public:
    LogonResumeEntry(std::string name, host::HostEnvironment& host);

    // Called first thing on every run. Returns whether an entry was present.
    // Throws BootstrapError(StateWriteFailure).
    bool clear();
    // Throws BootstrapError(StateWriteFailure).
    void schedule(const std::string& command_line);
    [[nodiscard]] bool present() const;

    [[nodiscard]] const std::string& name() const { return name_; }

private:
    std::string name_;
    host::HostEnvironment& host_;
};

}  // namespace hostprep::bootstrap
