#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace hostprep::config {

struct LoggingConfig {
    std::filesystem::path path;
    bool stdout_enabled{true};
    std::size_t max_bytes_per_entry{32768};
};

struct PackageManagerConfig {
    std::string command{"winget"};
    std::string remediation{
        "winget was not found. Update \"App Installer\" from the Microsoft Store and rerun."};
};

struct ToolDefinition {
    std::string name;
    std::string command;
    std::string package_id;
    bool container_engine{false};
};

struct VirtualizationConfig {
    std::vector<std::string> features{"Microsoft-Windows-Subsystem-Linux",
                                      "VirtualMachinePlatform"};
    std::chrono::milliseconds query_timeout{5000};
};

struct RepositoryConfig {
    std::string url{"https://github.com/njm2360/dekapu-dashboard.git"};
    // Relative to the user's home directory.
    std::filesystem::path directory{"dekapu-dashboard"};
    std::filesystem::path git_directory{"C:\\Program Files\\Git\\cmd"};
};

struct EnvironmentConfig {
    std::filesystem::path template_file{".env.example"};
    std::filesystem::path output_file{".env"};
    std::string user_key{"HOST_USER"};
    std::string log_dir_key{"VRCHAT_LOG_DIR"};
    // Relative to the user's home directory.
    std::filesystem::path log_dir{"AppData/LocalLow/VRChat/VRChat"};
};

struct EngineSettingsConfig {
    // Relative to the roaming application data directory.
    std::filesystem::path file{"Docker/settings.json"};
    bool auto_start{true};
    bool suppress_ui_on_start{true};
};

struct EngineConfig {
    std::filesystem::path install_directory{"C:\\Program Files\\Docker\\Docker"};
    std::filesystem::path desktop_executable{"Docker Desktop.exe"};
    std::filesystem::path cli_directory{"resources/bin"};
    std::string cli_command{"docker"};
    std::chrono::seconds poll_interval{5};
    std::chrono::seconds wait_budget{300};
    std::chrono::seconds first_boot_wait_budget{3600};
    EngineSettingsConfig settings;
};

struct ContinuationConfig {
    // Relative to the user's temp directory.
    std::filesystem::path stage_directory{"hostprep"};
    std::filesystem::path marker_file{"setup-complete"};
    std::string run_entry_name{"HostPrepResume"};
};

struct ProfileConfig {
    std::string name{"default"};
    LoggingConfig logging;
    PackageManagerConfig package_manager;
    std::vector<ToolDefinition> tools;
    VirtualizationConfig virtualization;
    RepositoryConfig repository;
    EnvironmentConfig environment;
    EngineConfig engine;
    ContinuationConfig continuation;
};

// Git then the container engine, as installed on a bare host.
std::vector<ToolDefinition> default_tools();

}  // namespace hostprep::config
