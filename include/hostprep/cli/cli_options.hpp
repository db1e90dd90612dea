#pragma once

#include <filesystem>

namespace hostprep::cli {

struct Options {
    std::filesystem::path profile;
    std::filesystem::path log_override;
    bool resumed{false};
    bool validate_only{false};
};

}  // namespace hostprep::cli
