#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "hostprep/config/config_types.hpp"

namespace hostprep::config {

class ConfigLoader {
public:
    // An empty path yields the built-in defaults.
    ProfileConfig load(const std::filesystem::path& path,
                       const std::filesystem::path& log_override = {}) const;

    ProfileConfig parse(const nlohmann::json& data) const;

    struct ValidationResult {
        bool ok{false};
        std::vector<std::string> errors;
        std::string name;
        // "name (package id)", container engine marked.
        std::vector<std::string> tools;
        std::vector<std::string> features;
        std::string repository_url;
        std::filesystem::path log_path;
    };

    ValidationResult validate(const std::filesystem::path& path) const;

private:
    static void validate_json(const nlohmann::json& data);
    static std::vector<ToolDefinition> parse_tools(const nlohmann::json& data);
};

}  // namespace hostprep::config
