#pragma once

#include <filesystem>

#include <nlohmann/json_fwd.hpp>

#include "hostprep/config/config_types.hpp"

namespace hostprep::host {
class HostEnvironment;
}

namespace hostprep::bootstrap {

// Writes the container engine's settings document so it starts with the user
// session and without opening its dashboard.
class EngineSettingsWriter {
public:
    EngineSettingsWriter(config::EngineSettingsConfig settings, std::filesystem::path settings_file);

    static EngineSettingsWriter for_host(const config::EngineSettingsConfig& settings,
                                         const host::HostEnvironment& host);

    [[nodiscard]] nlohmann::json document() const;
    // Overwrites any existing document. Throws BootstrapError(StateWriteFailure).
    void write() const;

    [[nodiscard]] const std::filesystem::path& settings_file() const { return settings_file_; }

private:
    config::EngineSettingsConfig settings_;
    std::filesystem::path settings_file_;
};

}  // namespace hostprep::bootstrap
