#include <cassert>
#include <string>

#include <nlohmann/json.hpp>

#include "hostprep/config/config_loader.hpp"
#include "support/fake_host.hpp"

using hostprep::config::ConfigLoader;

namespace {

void defaults_without_profile() {
    ConfigLoader loader;
    const auto profile = loader.load({});
    assert(profile.tools.size() == 2);
    assert(profile.tools[0].command == "git");
    assert(profile.tools[1].package_id == "Docker.DockerDesktop");
    assert(profile.tools[1].container_engine);
    assert(profile.virtualization.features.size() == 2);
    assert(profile.virtualization.query_timeout == std::chrono::milliseconds(5000));
    assert(profile.engine.poll_interval == std::chrono::seconds(5));
    assert(profile.engine.wait_budget == std::chrono::seconds(300));
    assert(profile.engine.first_boot_wait_budget == std::chrono::seconds(3600));
    assert(profile.package_manager.command == "winget");
    assert(profile.repository.url == "https://github.com/njm2360/dekapu-dashboard.git");
    assert(profile.repository.directory == "dekapu-dashboard");
    assert(loader.validate({}).ok);
}

void reads_profile_with_comments_and_overrides() {
    hostprep::testing::ScopedTempDir dir;
    const auto path = dir.path() / "hostprep.json";
    hostprep::testing::write_file(path, R"({
        // comments are accepted
        "name": "lab-pc",
        "logging": {"path": "C:/logs/hostprep.jsonl", "stdout": false, "max_bytes_per_entry": "huge"},
        "tools": [
            {"name": "git", "package_id": "Git.Git"},
            {"name": "docker", "package_id": "Docker.DockerDesktop", "container_engine": true}
        ],
        "virtualization": {"features": ["VirtualMachinePlatform"], "query_timeout_ms": 2500},
        "repository": {"url": "https://example.invalid/stack.git", "directory": "stack"},
        "engine": {"wait_budget_s": 120, "poll_interval_s": 0, "settings": {"auto_start": false}},
        "continuation": {"run_entry_name": "LabResume"}
    })");

    ConfigLoader loader;
    const auto profile = loader.load(path, dir.path() / "override.jsonl");
    assert(profile.name == "lab-pc");
    assert(profile.logging.path == dir.path() / "override.jsonl");
    assert(!profile.logging.stdout_enabled);
    assert(profile.logging.max_bytes_per_entry == 32768);
    assert(profile.tools[0].command == "git");
    assert(profile.virtualization.features.size() == 1);
    assert(profile.virtualization.query_timeout == std::chrono::milliseconds(2500));
    assert(profile.repository.url == "https://example.invalid/stack.git");
    assert(profile.repository.directory == "stack");
    assert(profile.engine.wait_budget == std::chrono::seconds(120));
    assert(profile.engine.poll_interval == std::chrono::seconds(5));
    assert(!profile.engine.settings.auto_start);
    assert(profile.engine.settings.suppress_ui_on_start);
    assert(profile.continuation.run_entry_name == "LabResume");

    const auto validation = loader.validate(path);
    assert(validation.ok);
    assert(validation.tools.size() == 2);
}

void rejects_malformed_profiles() {
    ConfigLoader loader;
    const auto rejects = [&loader](const nlohmann::json& data) {
        try {
            loader.parse(data);
        } catch (const std::exception&) {
            return true;
        }
        return false;
    };

    assert(rejects(nlohmann::json::array()));
    assert(rejects({{"tools", nlohmann::json::array()}}));
    assert(rejects({{"tools", {{{"name", "git"}}}}}));
    assert(rejects({{"virtualization", {{"features", nlohmann::json::array()}}}}));
    assert(rejects({{"continuation", {{"run_entry_name", ""}}}}));
    assert(rejects({{"tools",
                     {{{"name", "a"}, {"package_id", "A"}, {"container_engine", true}},
                      {{"name", "b"}, {"package_id", "B"}, {"container_engine", true}}}}}));
    assert(!rejects(nlohmann::json::object()));

    hostprep::testing::ScopedTempDir dir;
    const auto validation = loader.validate(dir.path() / "missing.json");
    assert(!validation.ok);
    assert(!validation.errors.empty());
}

}  // namespace

int main() {
    defaults_without_profile();
    reads_profile_with_comments_and_overrides();
    rejects_malformed_profiles();
    return 0;
}
