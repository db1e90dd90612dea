#include "hostprep/bootstrap/engine_settings.hpp"

#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

#include "hostprep/bootstrap/errors.hpp"
#include "hostprep/host/host_environment.hpp"

namespace hostprep::bootstrap {

EngineSettingsWriter::EngineSettingsWriter(config::EngineSettingsConfig settings,
                                           std::filesystem::path settings_file)
    : settings_(std::move(settings)), settings_file_(std::move(settings_file)) {}

EngineSettingsWriter EngineSettingsWriter::for_host(const config::EngineSettingsConfig& settings,
                                                    const host::HostEnvironment& host) {
    return EngineSettingsWriter(settings, host.roaming_app_data() / settings.file);
}

nlohmann::json EngineSettingsWriter::document() const {
    return nlohmann::json{
        {"AutoStart", settings_.auto_start},
        {"OpenUIOnStartupDisabled", settings_.suppress_ui_on_start}
    };
}

void EngineSettingsWriter::write() const {
    std::error_code ec;
    if (!settings_file_.parent_path().empty()) {
        std::filesystem::create_directories(settings_file_.parent_path(), ec);
        if (ec) {
            throw BootstrapError(ErrorKind::StateWriteFailure,
                                 "Cannot create " + host::path_to_utf8(settings_file_.parent_path()) +
                                     ": " + ec.message());
        }
    }

    // Binary mode: plain UTF-8, no byte-order mark, no newline translation.
    std::ofstream stream(settings_file_, std::ios::binary | std::ios::trunc);
    if (!stream) {
        throw BootstrapError(ErrorKind::StateWriteFailure,
                             "Cannot write engine settings " + host::path_to_utf8(settings_file_));
    }
    stream << document().dump(2) << '\n';
    if (!stream) {
        throw BootstrapError(ErrorKind::StateWriteFailure,
                             "Cannot write engine settings " + host::path_to_utf8(settings_file_));
    }
}

}  // namespace hostprep::bootstrap
