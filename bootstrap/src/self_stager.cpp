#include "hostprep/bootstrap/self_stager.hpp"

#include <system_error>

#include <nlohmann/json.hpp>

#include "hostprep/bootstrap/errors.hpp"
#include "hostprep/host/host_environment.hpp"
#include "hostprep/logging/json_logger.hpp"

namespace hostprep::bootstrap {

namespace {

bool same_file(const std::filesystem::path& lhs, const std::filesystem::path& rhs) {
    std::error_code ec;
    const bool equivalent = std::filesystem::equivalent(lhs, rhs, ec);
    return !ec && equivalent;
}

void copy_or_throw(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        throw BootstrapError(ErrorKind::StagingFailure,
                             "Cannot stage " + host::path_to_utf8(from) + " to " +
                                 host::path_to_utf8(to) + ": " + ec.message());
    }
}

}  // namespace

std::vector<std::string> build_handoff_arguments(const StagedCopy& staged,
                                                 const HandoffArguments& arguments,
                                                 bool resumed) {
    std::vector<std::string> result;
    const std::filesystem::path& profile = staged.profile.empty() ? arguments.profile : staged.profile;
    if (!profile.empty()) {
        result.emplace_back("--config");
        result.push_back(host::path_to_utf8(profile));
    }
    if (!arguments.log_override.empty()) {
        result.emplace_back("--log");
        result.push_back(host::path_to_utf8(std::filesystem::absolute(arguments.log_override)));
    }
    if (resumed) {
        result.emplace_back("--resumed");
    }
    return result;
}

SelfStager::SelfStager(const config::ContinuationConfig& config,
                       host::HostEnvironment& host,
                       logging::JsonLogger& logger)
    : config_(config), host_(host), logger_(logger) {}

std::filesystem::path SelfStager::stage_directory() const {
    return host_.temp_directory() / config_.stage_directory;
}

std::filesystem::path SelfStager::staged_executable() const {
    return stage_directory() / host_.current_executable().filename();
}

std::filesystem::path SelfStager::staged_profile() const {
    return stage_directory() / "hostprep.json";
}

StagedCopy SelfStager::ensure_staged(const std::filesystem::path& profile) {
    std::error_code ec;
    std::filesystem::create_directories(stage_directory(), ec);
    if (ec) {
        throw BootstrapError(ErrorKind::StagingFailure,
                             "Cannot create " + host::path_to_utf8(stage_directory()) + ": " + ec.message());
    }

    StagedCopy staged{};
    staged.executable = staged_executable();
    const std::filesystem::path running = host_.current_executable();

    const bool already_staged = std::filesystem::exists(staged.executable, ec);
    if (ec) {
        throw BootstrapError(ErrorKind::StagingFailure,
                             "Cannot inspect " + host::path_to_utf8(staged.executable) + ": " + ec.message());
    }

    bool copied = false;
    if (!already_staged && !same_file(running, staged.executable)) {
        copy_or_throw(running, staged.executable);
        copied = true;
    }

    if (!profile.empty()) {
        staged.profile = staged_profile();
        if (!same_file(profile, staged.profile)) {
            copy_or_throw(profile, staged.profile);
        }
    }

    logger_.event("stage.ensure", {
        {"executable", host::path_to_utf8(staged.executable)},
        {"profile", host::path_to_utf8(staged.profile)},
        {"copied", copied}
    });
    return staged;
}

}  // namespace hostprep::bootstrap
