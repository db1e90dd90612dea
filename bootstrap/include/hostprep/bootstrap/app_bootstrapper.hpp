#pragma once

#include <chrono>
#include <filesystem>

#include "hostprep/config/config_types.hpp"

namespace hostprep::host {
class Clock;
class HostEnvironment;
}

namespace hostprep::logging {
class JsonLogger;
}

namespace hostprep::bootstrap {

// Clones the stack repository, renders its environment file, starts the
// container engine and launches the compose stack once the engine answers.
class AppBootstrapper {
public:
    AppBootstrapper(const config::ProfileConfig& profile,
                    host::HostEnvironment& host,
                    host::Clock& clock,
                    logging::JsonLogger& logger);

    [[nodiscard]] std::filesystem::path checkout_directory() const;

    // Throws BootstrapError on the first failing step.
    void bring_up_stack(std::chrono::seconds wait_budget);

private:
    void ensure_git_on_path();
    void ensure_checkout();
    void render_environment();
    std::filesystem::path ensure_engine_on_path();
    void start_engine(const std::filesystem::path& desktop_executable);
    void wait_for_engine(std::chrono::seconds wait_budget);
    void compose_up();

    const config::ProfileConfig& profile_;
    host::HostEnvironment& host_;
    host::Clock& clock_;
    logging::JsonLogger& logger_;
};

}  // namespace hostprep::bootstrap
