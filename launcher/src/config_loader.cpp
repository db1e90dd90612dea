#include "hostprep/config/config_loader.hpp"

#include <cstdint>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "hostprep/config/config_types.hpp"

namespace hostprep::config {

namespace {

const nlohmann::json& field(const nlohmann::json& section, const char* key) {
    static const nlohmann::json missing;
    return section.contains(key) ? section[key] : missing;
}

bool is_truthy(const nlohmann::json& value, bool default_value) {
    return value.is_boolean() ? value.get<bool>() : default_value;
}

std::size_t clamp_size(const nlohmann::json& value, std::size_t fallback) {
    if (!value.is_number_unsigned()) {
        return fallback;
    }
    return static_cast<std::size_t>(value.get<std::uint64_t>());
}

template <typename Duration>
Duration read_duration(const nlohmann::json& section, const char* key, Duration fallback) {
    const auto& value = field(section, key);
    if (!value.is_number_unsigned() || value.get<std::uint64_t>() == 0) {
        return fallback;
    }
    return Duration(static_cast<typename Duration::rep>(value.get<std::uint64_t>()));
}

void read_string(const nlohmann::json& section, const char* key, std::string& target) {
    if (section.contains(key) && section[key].is_string()) {
        target = section[key].get<std::string>();
    }
}

void read_path(const nlohmann::json& section, const char* key, std::filesystem::path& target) {
    if (section.contains(key) && section[key].is_string()) {
        const std::string utf8 = section[key].get<std::string>();
        target = std::filesystem::path(std::u8string(utf8.begin(), utf8.end()));
    }
}

const nlohmann::json& section_of(const nlohmann::json& data, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (data.contains(key) && data[key].is_object()) {
        return data[key];
    }
    return empty;
}

nlohmann::json read_document(const std::filesystem::path& path) {
    std::ifstream stream(path);
    if (!stream) {
        throw std::runtime_error("Profile file cannot be opened: " + path.string());
    }
    return nlohmann::json::parse(stream, nullptr, true, true);
}

}  // namespace

std::vector<ToolDefinition> default_tools() {
    return {
        {"git", "git", "Git.Git", false},
        {"docker", "docker", "Docker.DockerDesktop", true},
    };
}

void ConfigLoader::validate_json(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw std::runtime_error("Profile JSON must be an object");
    }
    if (data.contains("name") && !data["name"].is_string()) {
        throw std::runtime_error("'name' must be a string");
    }
    for (const char* section : {"logging", "package_manager", "virtualization", "repository",
                                "environment", "engine", "continuation"}) {
        if (data.contains(section) && !data[section].is_object()) {
            throw std::runtime_error(std::string("'") + section + "' must be an object");
        }
    }
    if (data.contains("tools") && (!data["tools"].is_array() || data["tools"].empty())) {
        throw std::runtime_error("'tools' must be a non-empty array");
    }
    const auto& virtualization = section_of(data, "virtualization");
    if (virtualization.contains("features") &&
        (!virtualization["features"].is_array() || virtualization["features"].empty())) {
        throw std::runtime_error("'virtualization.features' must be a non-empty array");
    }
    const auto& continuation = section_of(data, "continuation");
    if (continuation.contains("run_entry_name") &&
        (!continuation["run_entry_name"].is_string() ||
         continuation["run_entry_name"].get<std::string>().empty())) {
        throw std::runtime_error("'continuation.run_entry_name' must be a non-empty string");
    }
}

std::vector<ToolDefinition> ConfigLoader::parse_tools(const nlohmann::json& data) {
    std::vector<ToolDefinition> tools;
    tools.reserve(data.size());

    bool engine_seen = false;
    for (const auto& entry : data) {
        if (!entry.is_object()) {
            throw std::runtime_error("Tool entry must be an object");
        }
        ToolDefinition def{};
        read_string(entry, "name", def.name);
        read_string(entry, "command", def.command);
        read_string(entry, "package_id", def.package_id);
        def.container_engine = is_truthy(field(entry, "container_engine"), false);

        if (def.name.empty() || def.package_id.empty()) {
            throw std::runtime_error("Tool entries require 'name' and 'package_id'");
        }
        if (def.command.empty()) {
            def.command = def.name;
        }
        if (def.container_engine && engine_seen) {
            throw std::runtime_error("Only one tool may be flagged as 'container_engine'");
        }
        engine_seen = engine_seen || def.container_engine;
        tools.push_back(def);
    }

    return tools;
}

ProfileConfig ConfigLoader::parse(const nlohmann::json& data) const {
    validate_json(data);

    ProfileConfig config{};
    read_string(data, "name", config.name);
    config.tools = data.contains("tools") ? parse_tools(data["tools"]) : default_tools();

    const auto& logging = section_of(data, "logging");
    read_path(logging, "path", config.logging.path);
    config.logging.stdout_enabled = is_truthy(field(logging, "stdout"), true);
    config.logging.max_bytes_per_entry =
        clamp_size(field(logging, "max_bytes_per_entry"), config.logging.max_bytes_per_entry);

    const auto& package_manager = section_of(data, "package_manager");
    read_string(package_manager, "command", config.package_manager.command);
    read_string(package_manager, "remediation", config.package_manager.remediation);

    const auto& virtualization = section_of(data, "virtualization");
    if (virtualization.contains("features")) {
        config.virtualization.features.clear();
        for (const auto& feature : virtualization["features"]) {
            if (!feature.is_string() || feature.get<std::string>().empty()) {
                throw std::runtime_error("Feature names must be non-empty strings");
            }
            config.virtualization.features.push_back(feature.get<std::string>());
        }
    }
    config.virtualization.query_timeout =
        read_duration(virtualization, "query_timeout_ms", config.virtualization.query_timeout);

    const auto& repository = section_of(data, "repository");
    read_string(repository, "url", config.repository.url);
    read_path(repository, "directory", config.repository.directory);
    read_path(repository, "git_directory", config.repository.git_directory);

    const auto& environment = section_of(data, "environment");
    read_path(environment, "template", config.environment.template_file);
    read_path(environment, "output", config.environment.output_file);
    read_string(environment, "user_key", config.environment.user_key);
    read_string(environment, "log_dir_key", config.environment.log_dir_key);
    read_path(environment, "log_dir", config.environment.log_dir);

    const auto& engine = section_of(data, "engine");
    read_path(engine, "install_directory", config.engine.install_directory);
    read_path(engine, "desktop_executable", config.engine.desktop_executable);
    read_path(engine, "cli_directory", config.engine.cli_directory);
    read_string(engine, "cli_command", config.engine.cli_command);
    config.engine.poll_interval = read_duration(engine, "poll_interval_s", config.engine.poll_interval);
    config.engine.wait_budget = read_duration(engine, "wait_budget_s", config.engine.wait_budget);
    config.engine.first_boot_wait_budget =
        read_duration(engine, "first_boot_wait_budget_s", config.engine.first_boot_wait_budget);

    const auto& settings = section_of(engine, "settings");
    read_path(settings, "file", config.engine.settings.file);
    config.engine.settings.auto_start =
        is_truthy(field(settings, "auto_start"), config.engine.settings.auto_start);
    config.engine.settings.suppress_ui_on_start =
        is_truthy(field(settings, "suppress_ui_on_start"), config.engine.settings.suppress_ui_on_start);

    const auto& continuation = section_of(data, "continuation");
    read_path(continuation, "stage_directory", config.continuation.stage_directory);
    read_path(continuation, "marker_file", config.continuation.marker_file);
    read_string(continuation, "run_entry_name", config.continuation.run_entry_name);

    return config;
}

ProfileConfig ConfigLoader::load(const std::filesystem::path& path,
                                 const std::filesystem::path& log_override) const {
    ProfileConfig config = path.empty() ? parse(nlohmann::json::object()) : parse(read_document(path));
    if (!log_override.empty()) {
        config.logging.path = log_override;
    }
    return config;
}

ConfigLoader::ValidationResult ConfigLoader::validate(const std::filesystem::path& path) const {
    ValidationResult result{};
    try {
        const ProfileConfig profile = load(path);
        result.name = profile.name;
        for (const auto& tool : profile.tools) {
            result.tools.push_back(tool.name + " (" + tool.package_id + ")" +
                                   (tool.container_engine ? " [container engine]" : ""));
        }
        result.features = profile.virtualization.features;
        result.repository_url = profile.repository.url;
        result.log_path = profile.logging.path;
        if (profile.repository.url.empty()) {
            result.errors.emplace_back("'repository.url' is empty; an existing checkout is required");
        }
    } catch (const std::exception& ex) {
        result.errors.emplace_back(ex.what());
        return result;
    }
    result.ok = result.errors.empty();
    return result;
}

}  // namespace hostprep::config
