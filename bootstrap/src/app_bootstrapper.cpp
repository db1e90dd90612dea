#include "hostprep/bootstrap/app_bootstrapper.hpp"

#include <system_error>

#include <nlohmann/json.hpp>

#include "hostprep/bootstrap/env_template.hpp"
#include "hostprep/bootstrap/errors.hpp"
#include "hostprep/bootstrap/readiness_poller.hpp"
#include "hostprep/host/clock.hpp"
#include "hostprep/host/host_environment.hpp"
#include "hostprep/logging/json_logger.hpp"

namespace hostprep::bootstrap {

namespace {

bool directory_exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

std::string describe(const host::CommandResult& result) {
    if (!result.started) {
        return result.error;
    }
    return "exit code " + std::to_string(result.exit_code);
}

}  // namespace

AppBootstrapper::AppBootstrapper(const config::ProfileConfig& profile,
                                 host::HostEnvironment& host,
                                 host::Clock& clock,
                                 logging::JsonLogger& logger)
    : profile_(profile), host_(host), clock_(clock), logger_(logger) {}

std::filesystem::path AppBootstrapper::checkout_directory() const {
    return host_.home_directory() / profile_.repository.directory;
}

void AppBootstrapper::bring_up_stack(std::chrono::seconds wait_budget) {
    ensure_git_on_path();
    ensure_checkout();
    render_environment();
    const std::filesystem::path desktop = ensure_engine_on_path();
    start_engine(desktop);
    wait_for_engine(wait_budget);
    compose_up();
}

void AppBootstrapper::ensure_git_on_path() {
    const auto& git_directory = profile_.repository.git_directory;
    if (git_directory.empty() || !directory_exists(git_directory)) {
        // The clone below is the real failure signal.
        logger_.event("stack.git_path", {
            {"level", "warn"},
            {"directory", host::path_to_utf8(git_directory)},
            {"found", false}
        });
        return;
    }
    host_.prepend_to_path(git_directory);
    logger_.event("stack.git_path", {{"directory", host::path_to_utf8(git_directory)}, {"found", true}});
}

void AppBootstrapper::ensure_checkout() {
    const std::filesystem::path checkout = checkout_directory();
    if (directory_exists(checkout)) {
        logger_.event("stack.clone", {{"directory", host::path_to_utf8(checkout)}, {"skipped", true}});
        return;
    }
    if (profile_.repository.url.empty()) {
        throw BootstrapError(ErrorKind::CloneFailure,
                             "repository.url is not configured and " + host::path_to_utf8(checkout) +
                                 " does not exist");
    }

    host::Command command{};
    command.program = "git";
    command.arguments = {"clone", profile_.repository.url, host::path_to_utf8(checkout)};
    command.working_directory = host_.home_directory();

    logger_.event("stack.clone", {
        {"url", profile_.repository.url},
        {"directory", host::path_to_utf8(checkout)},
        {"skipped", false}
    });
    const host::CommandResult result = host_.run(command, {});
    if (!result.succeeded()) {
        throw BootstrapError(ErrorKind::CloneFailure,
                             "git clone " + profile_.repository.url + " failed: " + describe(result));
    }
}

void AppBootstrapper::render_environment() {
    const std::filesystem::path checkout = checkout_directory();
    const auto& env = profile_.environment;
    const TemplateValues values = template_values_for(env, host_.home_directory(), host_.user_name());

    render_env_file(checkout / env.template_file, checkout / env.output_file, env, values);
    logger_.event("env.render", {
        {"output", host::path_to_utf8(checkout / env.output_file)},
        {env.user_key, values.user_name},
        {env.log_dir_key, values.log_directory}
    });
}

std::filesystem::path AppBootstrapper::ensure_engine_on_path() {
    const auto& engine = profile_.engine;
    const std::filesystem::path desktop = engine.install_directory / engine.desktop_executable;
    std::error_code ec;
    if (!std::filesystem::exists(desktop, ec)) {
        throw BootstrapError(ErrorKind::EngineNotFound,
                             "Container engine not found at " + host::path_to_utf8(desktop));
    }

    const std::filesystem::path cli_directory = engine.install_directory / engine.cli_directory;
    if (directory_exists(cli_directory)) {
        host_.prepend_to_path(cli_directory);
    }
    return desktop;
}

void AppBootstrapper::start_engine(const std::filesystem::path& desktop_executable) {
    const std::string image = host::path_to_utf8(desktop_executable.filename());
    if (host_.is_process_running(image)) {
        logger_.event("engine.start", {{"image", image}, {"already_running", true}});
        return;
    }

    host::Command command{};
    command.program = host::path_to_utf8(desktop_executable);
    std::string error;
    if (!host_.spawn_detached(command, error)) {
        // Not fatal by itself: the readiness poll decides.
        logger_.event("engine.start", {{"image", image}, {"level", "warn"}, {"error", error}});
        return;
    }
    logger_.event("engine.start", {{"image", image}, {"already_running", false}});
}

void AppBootstrapper::wait_for_engine(std::chrono::seconds wait_budget) {
    host::Command probe{};
    probe.program = profile_.engine.cli_command;
    probe.arguments = {"info"};

    host::RunOptions options{};
    options.capture_output = true;
    options.timeout = profile_.engine.poll_interval * 6;

    ReadinessPoller poller(clock_, profile_.engine.poll_interval, wait_budget, &logger_);
    const PollOutcome outcome = poller.wait_until_ready([&]() {
        return host_.run(probe, options).succeeded();
    });
    logger_.event("engine.ready", {
        {"attempts", outcome.attempts},
        {"elapsed_s", std::chrono::duration_cast<std::chrono::seconds>(outcome.elapsed).count()}
    });
}

void AppBootstrapper::compose_up() {
    host::Command command{};
    command.program = profile_.engine.cli_command;
    command.arguments = {"compose", "up", "-d"};
    command.working_directory = checkout_directory();

    logger_.event("stack.up", {{"directory", host::path_to_utf8(command.working_directory)}});
    const host::CommandResult result = host_.run(command, {});
    if (!result.succeeded()) {
        throw BootstrapError(ErrorKind::StackLaunchFailure, "docker compose up failed: " + describe(result));
    }
}

}  // namespace hostprep::bootstrap
