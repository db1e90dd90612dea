#include "hostprep/launcher/bootstrap_app.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "hostprep/bootstrap/app_bootstrapper.hpp"
#include "hostprep/bootstrap/continuation_guard.hpp"
#include "hostprep/bootstrap/engine_settings.hpp"
#include "hostprep/bootstrap/errors.hpp"
#include "hostprep/bootstrap/prerequisite_installer.hpp"
#include "hostprep/bootstrap/privilege_gate.hpp"
#include "hostprep/bootstrap/self_stager.hpp"
#include "hostprep/bootstrap/virtualization_enabler.hpp"
#include "hostprep/config/config_loader.hpp"
#include "hostprep/host/clock.hpp"
#include "hostprep/host/host_environment.hpp"
#include "hostprep/logging/json_logger.hpp"

namespace hostprep::launcher {

namespace {

constexpr char kDefaultProfileName[] = "hostprep.json";

void report_failure(const char* message, const logging::JsonLogger* logger) {
    std::cerr << "Error: " << message << '\n';
    if (logger != nullptr && !logger->path().empty()) {
        std::cerr << "Details: " << host::path_to_utf8(logger->path()) << '\n';
    }
}

}  // namespace

BootstrapApp::BootstrapApp(host::HostEnvironment& host, host::Clock& clock) : host_(host), clock_(clock) {}

std::filesystem::path BootstrapApp::resolve_profile(const cli::Options& options) const {
    if (!options.profile.empty()) {
        return std::filesystem::absolute(options.profile);
    }
    const std::filesystem::path beside = host_.current_executable().parent_path() / kDefaultProfileName;
    std::error_code ec;
    return std::filesystem::exists(beside, ec) ? beside : std::filesystem::path{};
}

std::filesystem::path BootstrapApp::default_log_path(const config::ProfileConfig& profile) const {
    return host_.temp_directory() / profile.continuation.stage_directory / "hostprep.jsonl";
}

void BootstrapApp::print_plan(const config::ConfigLoader::ValidationResult& plan,
                              const std::filesystem::path& source) {
    std::cout << "Profile: " << plan.name << '\n';
    std::cout << "Source: " << (source.empty() ? "<built-in defaults>" : host::path_to_utf8(source)) << '\n';
    std::cout << "Repository: " << (plan.repository_url.empty() ? "<unset>" : plan.repository_url) << '\n';
    std::cout << "Log file: "
              << (plan.log_path.empty() ? "<temp directory>" : host::path_to_utf8(plan.log_path)) << '\n';
    std::cout << "Tools:\n";
    for (const auto& tool : plan.tools) {
        std::cout << "  - " << tool << '\n';
    }
    std::cout << "Features:\n";
    for (const auto& feature : plan.features) {
        std::cout << "  - " << feature << '\n';
    }
}

bootstrap::RunState BootstrapApp::probe_state(const bootstrap::ContinuationGuard& guard,
                                              const bootstrap::PrerequisiteInstaller& installer,
                                              bootstrap::VirtualizationEnabler& enabler) const {
    bootstrap::HostFacts facts{};
    facts.elevated = host_.is_elevated();
    if (!facts.elevated) {
        return bootstrap::derive_run_state(facts);
    }
    facts.marker_present = !guard.should_run_setup_phase();
    if (facts.marker_present) {
        return bootstrap::derive_run_state(facts);
    }
    facts.package_manager_present = installer.package_manager_present();
    facts.tools_present = *facts.package_manager_present && installer.tools_present();
    if (*facts.tools_present) {
        for (const auto& feature : enabler.query_features()) {
            facts.features.push_back(feature.state);
        }
    }
    return bootstrap::derive_run_state(facts);
}

int BootstrapApp::run(const cli::Options& options) {
    std::unique_ptr<logging::JsonLogger> logger;
    try {
        // First action of every run, ahead of anything that can fail.
        const std::string default_entry_name = config::ContinuationConfig{}.run_entry_name;
        bool resume_pending = bootstrap::LogonResumeEntry(default_entry_name, host_).clear();

        const std::filesystem::path profile_path = resolve_profile(options);
        config::ConfigLoader loader;
        if (options.validate_only) {
            auto validation = loader.validate(profile_path);
            if (!options.log_override.empty()) {
                validation.log_path = options.log_override;
            }
            print_plan(validation, profile_path);
            for (const auto& error : validation.errors) {
                std::cerr << "  ! " << error << '\n';
            }
            return validation.ok ? 0 : 1;
        }

        config::ProfileConfig profile;
        try {
            profile = loader.load(profile_path, options.log_override);
        } catch (const std::exception& ex) {
            throw bootstrap::BootstrapError(bootstrap::ErrorKind::ConfigInvalid, ex.what());
        }

        if (profile.logging.path.empty()) {
            profile.logging.path = default_log_path(profile);
        }
        bootstrap::LogonResumeEntry resume_entry(profile.continuation.run_entry_name, host_);
        if (resume_entry.name() != default_entry_name) {
            resume_pending = resume_entry.clear() || resume_pending;
        }

        logger = std::make_unique<logging::JsonLogger>(profile.logging.path, profile.logging.stdout_enabled,
                                                       profile.logging.max_bytes_per_entry);
        logger->event("run.start", {
            {"profile", profile.name},
            {"config", host::path_to_utf8(profile_path)},
            {"resumed", options.resumed},
            {"resume_entry_cleared", resume_pending}
        });

        bootstrap::SelfStager stager(profile.continuation, host_, *logger);
        const bootstrap::HandoffArguments handoff{profile_path, options.log_override};

        bootstrap::PrivilegeGate gate(host_, stager, *logger);
        if (gate.run_with_elevation(handoff, options.resumed) == bootstrap::GateResult::Relaunched) {
            return 0;
        }

        const auto guard = bootstrap::ContinuationGuard::for_host(profile.continuation, host_);
        const auto settings_writer = bootstrap::EngineSettingsWriter::for_host(profile.engine.settings, host_);
        bootstrap::PrerequisiteInstaller installer(profile, host_, settings_writer, *logger);
        bootstrap::VirtualizationEnabler enabler(profile, host_, guard, resume_entry, stager, *logger);

        const bootstrap::RunState state = probe_state(guard, installer, enabler);
        logger->event("run.state", {{"state", std::string(bootstrap::run_state_name(state))}});

        bool engine_installed = false;
        switch (state) {
            case bootstrap::RunState::Unprivileged:
                throw bootstrap::BootstrapError(bootstrap::ErrorKind::ElevationFailed,
                                                "Process lost its administrator rights");
            case bootstrap::RunState::PendingReboot:
                enabler.schedule_resume_and_restart(handoff);
                return 0;
            case bootstrap::RunState::NeedsPrerequisites: {
                const bootstrap::PrerequisiteReport report = installer.ensure_all();
                nlohmann::json tools = nlohmann::json::object();
                for (const auto& tool : report.tools) {
                    tools[tool.name] = std::string(bootstrap::tool_outcome_name(tool.outcome));
                }
                logger->event("prereq.report", {{"tools", tools}, {"engine_installed", report.engine_installed}});
                engine_installed = report.engine_installed;
            }
                [[fallthrough]];
            case bootstrap::RunState::NeedsVirtualization:
                if (enabler.ensure_virtualization(handoff) == bootstrap::VirtualizationResult::RebootScheduled) {
                    return 0;
                }
                [[fallthrough]];
            case bootstrap::RunState::Ready:
                break;
        }

        // A freshly installed engine initialises slowly on its first start.
        const auto wait_budget = (options.resumed || engine_installed) ? profile.engine.first_boot_wait_budget
                                                                       : profile.engine.wait_budget;
        bootstrap::AppBootstrapper bootstrapper(profile, host_, clock_, *logger);
        bootstrapper.bring_up_stack(wait_budget);

        logger->event("run.complete", {{"checkout", host::path_to_utf8(bootstrapper.checkout_directory())}});
        return 0;
    } catch (const bootstrap::BootstrapError& ex) {
        if (logger) {
            logger->event("bootstrap.error", {
                {"kind", std::string(bootstrap::error_kind_name(ex.kind()))},
                {"message", ex.what()}
            });
        }
        report_failure(ex.what(), logger.get());
        return 1;
    } catch (const std::exception& ex) {
        if (logger) {
            logger->event("bootstrap.error", {{"message", ex.what()}});
        }
        report_failure(ex.what(), logger.get());
        return 1;
    }
}

}  // namespace hostprep::launcher
