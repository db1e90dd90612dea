#include "hostprep/bootstrap/env_template.hpp"

#include <cctype>
#include <fstream>
#include <iterator>

#include "hostprep/bootstrap/errors.hpp"
#include "hostprep/host/host_environment.hpp"

namespace hostprep::bootstrap {

namespace {

constexpr std::string_view kUtf8Bom{"\xEF\xBB\xBF"};

bool has_key(std::string_view line, const std::string& key) {
    const auto first = line.find_first_not_of(" \t");
    if (first == std::string_view::npos || key.empty()) {
        return false;
    }
    line.remove_prefix(first);
    return line.size() > key.size() && line.compare(0, key.size(), key) == 0 && line[key.size()] == '=';
}

}  // namespace

std::string to_engine_mount_path(std::string_view windows_path) {
    std::string converted(windows_path);
    for (char& c : converted) {
        if (c == '\\') {
            c = '/';
        }
    }

    if (converted.size() >= 2 && std::isalpha(static_cast<unsigned char>(converted[0])) &&
        converted[1] == ':') {
        const char drive = static_cast<char>(std::tolower(static_cast<unsigned char>(converted[0])));
        std::string rest = converted.substr(2);
        if (rest.empty() || rest.front() != '/') {
            rest.insert(rest.begin(), '/');
        }
        return std::string("/host_mnt/") + drive + rest;
    }
    return converted;
}

TemplateValues template_values_for(const config::EnvironmentConfig& config,
                                   const std::filesystem::path& home_directory,
                                   const std::string& user_name) {
    TemplateValues values{};
    values.user_name = user_name;

    std::string home = host::path_to_utf8(home_directory);
    while (!home.empty() && (home.back() == '\\' || home.back() == '/')) {
        home.pop_back();
    }
    values.log_directory = to_engine_mount_path(home + "\\" + host::path_to_utf8(config.log_dir));
    return values;
}

std::string render_env_template(std::string_view template_text,
                                const config::EnvironmentConfig& config,
                                const TemplateValues& values) {
    std::string rendered;
    rendered.reserve(template_text.size() + values.log_directory.size());

    std::size_t start = 0;
    // A byte-order mark is kept but never part of the first key.
    if (template_text.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        rendered.append(kUtf8Bom);
        start = kUtf8Bom.size();
    }
    while (start < template_text.size()) {
        std::size_t end = template_text.find('\n', start);
        const bool has_newline = end != std::string_view::npos;
        if (!has_newline) {
            end = template_text.size();
        }
        std::string_view line = template_text.substr(start, end - start);
        const bool crlf = !line.empty() && line.back() == '\r';
        if (crlf) {
            line.remove_suffix(1);
        }

        if (has_key(line, config.user_key)) {
            rendered += config.user_key + "=" + values.user_name;
        } else if (has_key(line, config.log_dir_key)) {
            rendered += config.log_dir_key + "=" + values.log_directory;
        } else {
            rendered.append(line);
        }
        if (crlf) {
            rendered.push_back('\r');
        }
        if (has_newline) {
            rendered.push_back('\n');
        }
        start = end + 1;
    }
    return rendered;
}

void render_env_file(const std::filesystem::path& template_file,
                     const std::filesystem::path& output,
                     const config::EnvironmentConfig& config,
                     const TemplateValues& values) {
    std::ifstream input(template_file, std::ios::binary);
    if (!input) {
        throw BootstrapError(ErrorKind::TemplateMissing,
                             "Environment template not found: " + host::path_to_utf8(template_file));
    }
    const std::string text{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};

    std::ofstream stream(output, std::ios::binary | std::ios::trunc);
    if (!stream) {
        throw BootstrapError(ErrorKind::StateWriteFailure,
                             "Cannot write environment file " + host::path_to_utf8(output));
    }
    stream << render_env_template(text, config, values);
    if (!stream) {
        throw BootstrapError(ErrorKind::StateWriteFailure,
                             "Cannot write environment file " + host::path_to_utf8(output));
    }
}

}  // namespace hostprep::bootstrap
