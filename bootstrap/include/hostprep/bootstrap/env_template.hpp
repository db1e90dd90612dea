#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "hostprep/config/config_types.hpp"

namespace hostprep::bootstrap {

// C:\Users\Alice\AppData -> /host_mnt/c/Users/Alice/AppData, the path under
// which the container engine exposes Windows drives to Linux containers.
std::string to_engine_mount_path(std::string_view windows_path);

struct TemplateValues {
    std::string user_name;
    std::string log_directory;
};

TemplateValues template_values_for(const config::EnvironmentConfig& config,
                                   const std::filesystem::path& home_directory,
                                   const std::string& user_name);

// Rewrites `KEY=...` lines for the recognised keys; every other line, and the
// original line endings, pass through untouched.
std::string render_env_template(std::string_view template_text,
                                const config::EnvironmentConfig& config,
                                const TemplateValues& values);

// Full overwrite of `output`. Throws BootstrapError(TemplateMissing | StateWriteFailure).
void render_env_file(const std::filesystem::path& template_file,
                     const std::filesystem::path& output,
                     const config::EnvironmentConfig& config,
                     const TemplateValues& values);

}  // namespace hostprep::bootstrap
