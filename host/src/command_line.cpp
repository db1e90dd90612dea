#include "hostprep/host/host_environment.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace hostprep::host {

std::string quote_argument(std::string_view argument) {
    if (!argument.empty() && argument.find_first_of(" \t\n\v\"") == std::string_view::npos) {
        return std::string(argument);
    }

    std::string quoted{"\""};
    for (auto it = argument.begin();; ++it) {
        std::size_t backslashes = 0;
        while (it != argument.end() && *it == '\\') {
            ++it;
            ++backslashes;
        }
        if (it == argument.end()) {
            // Backslashes before the closing quote must be doubled.
            quoted.append(backslashes * 2, '\\');
            break;
        }
        if (*it == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
            quoted.push_back('"');
        } else {
            quoted.append(backslashes, '\\');
            quoted.push_back(*it);
        }
    }
    quoted.push_back('"');
    return quoted;
}

std::string join_arguments(const std::vector<std::string>& arguments) {
    std::string joined;
    for (const auto& argument : arguments) {
        if (!joined.empty()) {
            joined.push_back(' ');
        }
        joined += quote_argument(argument);
    }
    return joined;
}

std::string build_command_line(const std::string& program, const std::vector<std::string>& arguments) {
    std::string line = quote_argument(program);
    if (!arguments.empty()) {
        line.push_back(' ');
        line += join_arguments(arguments);
    }
    return line;
}

std::string path_to_utf8(const std::filesystem::path& path) {
    const std::u8string utf8 = path.u8string();
    return std::string(utf8.begin(), utf8.end());
}

}  // namespace hostprep::host
