#include "hostprep/bootstrap/continuation_guard.hpp"

#include <fstream>
#include <system_error>

#include "hostprep/bootstrap/errors.hpp"
#include "hostprep/host/host_environment.hpp"

namespace hostprep::bootstrap {

ContinuationGuard::ContinuationGuard(std::filesystem::path marker) : marker_(std::move(marker)) {}

ContinuationGuard ContinuationGuard::for_host(const config::ContinuationConfig& config,
                                              const host::HostEnvironment& host) {
    return ContinuationGuard(host.temp_directory() / config.stage_directory / config.marker_file);
}

bool ContinuationGuard::should_run_setup_phase() const {
    std::error_code ec;
    return !std::filesystem::exists(marker_, ec);
}

void ContinuationGuard::mark_complete() const {
    if (!should_run_setup_phase()) {
        return;
    }
    std::error_code ec;
    if (!marker_.parent_path().empty()) {
        std::filesystem::create_directories(marker_.parent_path(), ec);
    }
    std::ofstream stream(marker_, std::ios::binary | std::ios::trunc);
    if (!stream) {
        throw BootstrapError(ErrorKind::StateWriteFailure,
                             "Cannot create continuation marker " + host::path_to_utf8(marker_));
    }
}

LogonResumeEntry::LogonResumeEntry(std::string name, host::HostEnvironment& host)
    : name_(std::move(name)), host_(host) {}

bool LogonResumeEntry::clear() {
    const bool was_present = present();
    std::string error;
    if (!host_.remove_run_entry(name_, error)) {
        throw BootstrapError(ErrorKind::StateWriteFailure,
                             "Cannot remove logon resume entry '" + name_ + "': " + error);
    }
    return was_present;
}

void LogonResumeEntry::schedule(const std::string& command_line) {
    std::string error;
    if (!host_.set_run_entry(name_, command_line, error)) {
        throw BootstrapError(ErrorKind::StateWriteFailure,
                             "Cannot register logon resume entry '" + name_ + "': " + error);
    }
}

bool LogonResumeEntry::present() const {
    return host_.has_run_entry(name_);
}

}  // namespace hostprep::bootstrap
