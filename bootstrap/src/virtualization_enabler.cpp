#include "hostprep/bootstrap/virtualization_enabler.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <nlohmann/json.hpp>

#include "hostprep/bootstrap/continuation_guard.hpp"
#include "hostprep/bootstrap/errors.hpp"
#include "hostprep/host/host_environment.hpp"
#include "hostprep/logging/json_logger.hpp"

namespace hostprep::bootstrap {

namespace {

constexpr char kFeatureTool[] = "dism";
// ERROR_SUCCESS_REBOOT_REQUIRED
constexpr int kRebootRequired = 3010;

std::string trim(std::string_view value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return std::string(value.substr(begin, end - begin + 1));
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}  // namespace

FeatureState parse_feature_state(std::string_view dism_output) {
    std::istringstream stream{std::string(dism_output)};
    std::string line;
    while (std::getline(stream, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos || to_lower(trim(line.substr(0, colon))) != "state") {
            continue;
        }
        const std::string state = to_lower(trim(line.substr(colon + 1)));
        if (state == "enabled") {
            return FeatureState::Enabled;
        }
        if (state == "enable pending") {
            return FeatureState::EnablePending;
        }
        return FeatureState::Disabled;
    }
    return FeatureState::Disabled;
}

VirtualizationEnabler::VirtualizationEnabler(const config::ProfileConfig& profile,
                                             host::HostEnvironment& host,
                                             const ContinuationGuard& guard,
                                             LogonResumeEntry& resume_entry,
                                             SelfStager& stager,
                                             logging::JsonLogger& logger)
    : profile_(profile),
      host_(host),
      guard_(guard),
      resume_entry_(resume_entry),
      stager_(stager),
      logger_(logger) {}

FeatureState VirtualizationEnabler::query_feature(const std::string& feature) {
    host::Command command{};
    command.program = kFeatureTool;
    command.arguments = {"/English", "/Online", "/Get-FeatureInfo", "/FeatureName:" + feature};

    host::RunOptions options{};
    options.timeout = profile_.virtualization.query_timeout;
    options.capture_output = true;

    const host::CommandResult result = host_.run(command, options);
    FeatureState state = FeatureState::Disabled;
    if (result.succeeded()) {
        state = parse_feature_state(result.output);
    }

    logger_.event("virtualization.feature", {
        {"feature", feature},
        {"state", std::string(feature_state_name(state))},
        {"exit_code", result.exit_code},
        {"timed_out", result.timed_out}
    });
    return state;
}

std::vector<FeatureStatus> VirtualizationEnabler::query_features() {
    std::vector<FeatureStatus> features;
    features.reserve(profile_.virtualization.features.size());
    for (const auto& feature : profile_.virtualization.features) {
        features.push_back({feature, query_feature(feature)});
    }
    return features;
}

void VirtualizationEnabler::enable_feature(const std::string& feature) {
    host::Command command{};
    command.program = kFeatureTool;
    command.arguments = {"/Online", "/Enable-Feature", "/FeatureName:" + feature, "/All", "/NoRestart"};

    logger_.event("virtualization.enable", {{"feature", feature}});
    const host::CommandResult result = host_.run(command, {});
    if (!result.started || result.timed_out ||
        (result.exit_code != 0 && result.exit_code != kRebootRequired)) {
        std::string message = "Failed to enable Windows feature " + feature;
        message += result.started ? " (exit code " + std::to_string(result.exit_code) + ")"
                                  : ": " + result.error;
        throw BootstrapError(ErrorKind::FeatureEnableFailure, message);
    }
}

VirtualizationResult VirtualizationEnabler::ensure_virtualization(const HandoffArguments& arguments) {
    const std::vector<FeatureStatus> features = query_features();

    const bool all_enabled = std::all_of(features.begin(), features.end(), [](const auto& status) {
        return status.state == FeatureState::Enabled;
    });
    if (all_enabled) {
        guard_.mark_complete();
        logger_.event("virtualization.ready", {{"marker", host::path_to_utf8(guard_.marker_path())}});
        return VirtualizationResult::Ready;
    }

    for (const auto& status : features) {
        if (status.state == FeatureState::Disabled) {
            enable_feature(status.name);
        }
    }
    return schedule_resume_and_restart(arguments);
}

VirtualizationResult VirtualizationEnabler::schedule_resume_and_restart(const HandoffArguments& arguments) {
    // Features become active only after the restart; the resumed run must not
    // repeat the setup phase.
    guard_.mark_complete();

    const StagedCopy staged = stager_.ensure_staged(arguments.profile);
    const std::string command_line = host::build_command_line(
        host::path_to_utf8(staged.executable), build_handoff_arguments(staged, arguments, true));
    resume_entry_.schedule(command_line);
    logger_.event("resume.register", {
        {"name", resume_entry_.name()},
        {"command_line", command_line}
    });

    std::string error;
    if (!host_.request_restart(error)) {
        throw BootstrapError(ErrorKind::RestartFailure,
                             "Virtualization features are enabled but the restart request failed: " +
                                 error + ". Restart Windows manually to continue.");
    }
    logger_.event("host.restart", {{"requested", true}});
    return VirtualizationResult::RebootScheduled;
}

}  // namespace hostprep::bootstrap
