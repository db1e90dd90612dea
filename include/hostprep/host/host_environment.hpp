#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hostprep::host {

struct Command {
    std::string program;
    std::vector<std::string> arguments;
    std::filesystem::path working_directory;
};

struct CommandResult {
    bool started{false};
    bool timed_out{false};
    int exit_code{-1};
    std::string output;
    std::string error;

    [[nodiscard]] bool succeeded() const { return started && !timed_out && exit_code == 0; }
};

struct RunOptions {
    std::optional<std::chrono::milliseconds> timeout;
    bool capture_output{false};
};

enum class ElevationOutcome {
    Started,
    Declined,
    Failed,
};

// Everything the bootstrap needs from the operating system. The Win32
// implementation lives in host/src; tests substitute an in-memory host.
class HostEnvironment {
public:
    virtual ~HostEnvironment() = default;

    virtual bool is_elevated() const = 0;
    virtual std::filesystem::path current_executable() const = 0;
    virtual std::filesystem::path temp_directory() const = 0;
    virtual std::filesystem::path home_directory() const = 0;
    virtual std::filesystem::path roaming_app_data() const = 0;
    virtual std::string user_name() const = 0;

    virtual std::optional<std::filesystem::path> find_on_path(std::string_view command) const = 0;
    virtual void prepend_to_path(const std::filesystem::path& directory) = 0;
    virtual bool is_process_running(std::string_view image_name) const = 0;

    virtual CommandResult run(const Command& command, const RunOptions& options) = 0;
    virtual bool spawn_detached(const Command& command, std::string& error) = 0;
    virtual ElevationOutcome relaunch_elevated(const std::filesystem::path& executable,
                                               const std::vector<std::string>& arguments,
                                               std::string& error) = 0;

    virtual bool set_run_entry(const std::string& name,
                               const std::string& command_line,
                               std::string& error) = 0;
    virtual bool remove_run_entry(const std::string& name, std::string& error) = 0;
    virtual bool has_run_entry(const std::string& name) const = 0;

    virtual bool request_restart(std::string& error) = 0;
};

// Throws on platforms without a native host implementation.
std::unique_ptr<HostEnvironment> create_native_host();

// Command-line quoting compatible with CommandLineToArgvW and the MSVC runtime.
std::string quote_argument(std::string_view argument);
std::string join_arguments(const std::vector<std::string>& arguments);
std::string build_command_line(const std::string& program, const std::vector<std::string>& arguments);

std::string path_to_utf8(const std::filesystem::path& path);

}  // namespace hostprep::host
