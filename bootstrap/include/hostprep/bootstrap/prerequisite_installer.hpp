#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "hostprep/config/config_types.hpp"

namespace hostprep::host {
class HostEnvironment;
}

namespace hostprep::logging {
class JsonLogger;
}

namespace hostprep::bootstrap {

class EngineSettingsWriter;

enum class ToolOutcome {
    AlreadyPresent,
    Installed,
};

std::string_view tool_outcome_name(ToolOutcome outcome);

struct ToolReport {
    std::string name;
    ToolOutcome outcome{ToolOutcome::AlreadyPresent};
};

struct PrerequisiteReport {
    std::vector<ToolReport> tools;
    bool engine_installed{false};
};

class PrerequisiteInstaller {
public:
    PrerequisiteInstaller(const config::ProfileConfig& profile,
                          host::HostEnvironment& host,
                          const EngineSettingsWriter& settings_writer,
                          logging::JsonLogger& logger);

    [[nodiscard]] bool package_manager_present() const;
    [[nodiscard]] bool tools_present() const;

    // Throws BootstrapError(PrerequisiteMissing) with the remediation text.
    void ensure_package_manager() const;
    // Throws BootstrapError(InstallFailure) when the package manager fails.
    ToolOutcome ensure_tool(const config::ToolDefinition& tool);
    PrerequisiteReport ensure_all();

private:
    void install(const config::ToolDefinition& tool);

    const config::ProfileConfig& profile_;
    host::HostEnvironment& host_;
    const EngineSettingsWriter& settings_writer_;
    logging::JsonLogger& logger_;
};

}  // namespace hostprep::bootstrap
