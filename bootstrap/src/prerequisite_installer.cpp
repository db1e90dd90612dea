#include "hostprep/bootstrap/prerequisite_installer.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

#include "hostprep/bootstrap/engine_settings.hpp"
#include "hostprep/bootstrap/errors.hpp"
#include "hostprep/host/host_environment.hpp"
#include "hostprep/logging/json_logger.hpp"

namespace hostprep::bootstrap {

std::string_view tool_outcome_name(ToolOutcome outcome) {
    switch (outcome) {
        case ToolOutcome::AlreadyPresent:
            return "already-present";
        case ToolOutcome::Installed:
            return "installed";
    }
    return "unknown";
}

PrerequisiteInstaller::PrerequisiteInstaller(const config::ProfileConfig& profile,
                                             host::HostEnvironment& host,
                                             const EngineSettingsWriter& settings_writer,
                                             logging::JsonLogger& logger)
    : profile_(profile), host_(host), settings_writer_(settings_writer), logger_(logger) {}

bool PrerequisiteInstaller::package_manager_present() const {
    return host_.find_on_path(profile_.package_manager.command).has_value();
}

bool PrerequisiteInstaller::tools_present() const {
    return std::all_of(profile_.tools.begin(), profile_.tools.end(), [this](const auto& tool) {
        return host_.find_on_path(tool.command).has_value();
    });
}

void PrerequisiteInstaller::ensure_package_manager() const {
    const auto location = host_.find_on_path(profile_.package_manager.command);
    if (!location) {
        logger_.event("prereq.package_manager", {
            {"command", profile_.package_manager.command},
            {"present", false}
        });
        throw BootstrapError(ErrorKind::PrerequisiteMissing, profile_.package_manager.remediation);
    }
    logger_.event("prereq.package_manager", {
        {"command", profile_.package_manager.command},
        {"present", true},
        {"path", host::path_to_utf8(*location)}
    });
}

void PrerequisiteInstaller::install(const config::ToolDefinition& tool) {
    host::Command command{};
    command.program = profile_.package_manager.command;
    command.arguments = {"install",
                         "--id",
                         tool.package_id,
                         "-e",
                         "--source",
                         "winget",
                         "--accept-package-agreements",
                         "--accept-source-agreements",
                         "--silent"};

    logger_.event("prereq.install", {{"tool", tool.name}, {"package_id", tool.package_id}});
    const host::CommandResult result = host_.run(command, {});
    if (!result.succeeded()) {
        std::string message = "Installing " + tool.name + " (" + tool.package_id + ") failed";
        if (!result.started) {
            message += ": " + result.error;
        } else {
            message += " with exit code " + std::to_string(result.exit_code);
        }
        throw BootstrapError(ErrorKind::InstallFailure, message);
    }
}

ToolOutcome PrerequisiteInstaller::ensure_tool(const config::ToolDefinition& tool) {
    if (host_.find_on_path(tool.command)) {
        logger_.event("prereq.tool", {
            {"tool", tool.name},
            {"outcome", std::string(tool_outcome_name(ToolOutcome::AlreadyPresent))}
        });
        return ToolOutcome::AlreadyPresent;
    }

    install(tool);
    if (tool.container_engine) {
        settings_writer_.write();
        logger_.event("settings.write", {{"path", host::path_to_utf8(settings_writer_.settings_file())}});
    }
    logger_.event("prereq.tool", {
        {"tool", tool.name},
        {"outcome", std::string(tool_outcome_name(ToolOutcome::Installed))}
    });
    return ToolOutcome::Installed;
}

PrerequisiteReport PrerequisiteInstaller::ensure_all() {
    ensure_package_manager();

    PrerequisiteReport report{};
    for (const auto& tool : profile_.tools) {
        const ToolOutcome outcome = ensure_tool(tool);
        report.tools.push_back({tool.name, outcome});
        if (tool.container_engine && outcome == ToolOutcome::Installed) {
            report.engine_installed = true;
        }
    }
    return report;
}

}  // namespace hostprep::bootstrap
