#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "hostprep/host/clock.hpp"
#include "hostprep/host/host_environment.hpp"

namespace hostprep::testing {

class ScopedTempDir {
public:
    ScopedTempDir() {
        std::random_device device;
        path_ = std::filesystem::temp_directory_path() /
                ("hostprep-test-" + std::to_string(device()) + std::to_string(device()));
        std::filesystem::create_directories(path_);
    }
    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, std::string_view content) {
    if (!path.parent_path().empty()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    stream << content;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
}

class FakeClock final : public host::Clock {
public:
    time_point now() const override { return time_point{} + offset_; }
    void sleep_for(duration interval) override {
        offset_ += interval;
        ++sleeps_;
    }

    duration elapsed() const { return offset_; }
    int sleeps() const { return sleeps_; }

private:
    duration offset_{std::chrono::hours(1)};
    int sleeps_{0};
};

// In-memory host: files live under a temp directory, everything else
// (PATH, registry, processes, elevation) is recorded in plain members.
class FakeHost final : public host::HostEnvironment {
public:
    explicit FakeHost(std::filesystem::path root) : root_(std::move(root)) {
        std::filesystem::create_directories(temp_directory());
        std::filesystem::create_directories(home_directory());
        std::filesystem::create_directories(roaming_app_data());
        write_file(current_executable(), "MZ");
    }

    // --- knobs ---
    bool elevated{true};
    std::set<std::string> on_path{"winget", "git", "docker"};
    std::set<std::string> running_images;
    std::map<std::string, std::string> feature_states;  // dism "State : ..." value, default Enabled
    bool feature_query_times_out{false};
    int install_exit_code{0};
    int enable_exit_code{0};
    int clone_exit_code{0};
    std::string cloned_template{"HOST_USER=changeme\nVRCHAT_LOG_DIR=changeme\nTZ=Asia/Tokyo\n"};
    int engine_probe_failures{0};
    bool engine_never_ready{false};
    int compose_exit_code{0};
    host::ElevationOutcome relaunch_outcome{host::ElevationOutcome::Started};
    bool restart_succeeds{true};

    // --- recordings ---
    std::vector<host::Command> commands;
    std::vector<host::Command> detached;
    std::vector<std::pair<std::filesystem::path, std::vector<std::string>>> relaunches;
    std::map<std::string, std::string> run_entries;
    std::vector<std::filesystem::path> path_prepends;
    int restart_requests{0};
    int run_entry_removals{0};

    bool is_elevated() const override { return elevated; }
    std::filesystem::path current_executable() const override { return root_ / "Downloads" / "hostprep.exe"; }
    std::filesystem::path temp_directory() const override { return root_ / "Temp"; }
    std::filesystem::path home_directory() const override { return root_ / "Users" / "Alice"; }
    std::filesystem::path roaming_app_data() const override { return root_ / "Users" / "Alice" / "AppData" / "Roaming"; }
    std::string user_name() const override { return "Alice"; }

    std::optional<std::filesystem::path> find_on_path(std::string_view command) const override {
        if (on_path.count(std::string(command)) == 0) {
            return std::nullopt;
        }
        return root_ / "bin" / (std::string(command) + ".exe");
    }

    void prepend_to_path(const std::filesystem::path& directory) override { path_prepends.push_back(directory); }

    bool is_process_running(std::string_view image_name) const override {
        return running_images.count(std::string(image_name)) != 0;
    }

    host::CommandResult run(const host::Command& command, const host::RunOptions& options) override {
        commands.push_back(command);
        host::CommandResult result{};
        result.started = true;
        result.exit_code = 0;

        const auto& args = command.arguments;
        const std::string first = args.empty() ? std::string{} : args.front();
        if (command.program == "winget") {
            result.exit_code = install_exit_code;
        } else if (command.program == "dism" && args.size() >= 4 && args[2] == "/Get-FeatureInfo") {
            if (feature_query_times_out) {
                result.timed_out = true;
                result.exit_code = 1460;
                return result;
            }
            const std::string feature = args[3].substr(std::string("/FeatureName:").size());
            const auto state = feature_states.find(feature);
            result.output = "Feature Name : " + feature + "\r\nState : " +
                            (state == feature_states.end() ? std::string("Enabled") : state->second) + "\r\n";
        } else if (command.program == "dism") {
            result.exit_code = enable_exit_code;
        } else if (command.program == "git" && first == "clone") {
            result.exit_code = clone_exit_code;
            if (clone_exit_code == 0) {
                write_file(std::filesystem::path(args[2]) / ".env.example", cloned_template);
            }
        } else if (command.program == "docker" && first == "info") {
            if (engine_never_ready || engine_probe_failures > 0) {
                --engine_probe_failures;
                result.exit_code = 1;
            }
        } else if (command.program == "docker" && first == "compose") {
            result.exit_code = compose_exit_code;
        }
        (void)options;
        return result;
    }

    bool spawn_detached(const host::Command& command, std::string&) override {
        detached.push_back(command);
        return true;
    }

    host::ElevationOutcome relaunch_elevated(const std::filesystem::path& executable,
                                             const std::vector<std::string>& arguments,
                                             std::string& error) override {
        relaunches.emplace_back(executable, arguments);
        if (relaunch_outcome != host::ElevationOutcome::Started) {
            error = "ShellExecuteExW failed with error 1223";
        }
        return relaunch_outcome;
    }

    bool set_run_entry(const std::string& name, const std::string& command_line, std::string&) override {
        run_entries[name] = command_line;
        return true;
    }

    bool remove_run_entry(const std::string& name, std::string&) override {
        ++run_entry_removals;
        run_entries.erase(name);
        return true;
    }

    bool has_run_entry(const std::string& name) const override { return run_entries.count(name) != 0; }

    bool request_restart(std::string& error) override {
        ++restart_requests;
        if (!restart_succeeds) {
            error = "InitiateSystemShutdownExW failed with error 5";
        }
        return restart_succeeds;
    }

    // --- helpers ---
    std::size_t count_commands(std::string_view program, std::string_view first_argument = {}) const {
        std::size_t count = 0;
        for (const auto& command : commands) {
            if (command.program != program) {
                continue;
            }
            if (first_argument.empty() ||
                (!command.arguments.empty() && command.arguments.front() == first_argument)) {
                ++count;
            }
        }
        return count;
    }

    std::size_t count_dism(std::string_view operation) const {
        std::size_t count = 0;
        for (const auto& command : commands) {
            if (command.program == "dism" && command.arguments.size() >= 3 &&
                (command.arguments[1] == operation || command.arguments[2] == operation)) {
                ++count;
            }
        }
        return count;
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

}  // namespace hostprep::testing
