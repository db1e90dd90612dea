#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace hostprep::logging {

// One JSON object per line: {"ts": <UTC ISO-8601>, "type": <event>, ...fields}.
// Appends to `path` (parent directories are created) and optionally mirrors to
// stdout. An empty path disables the file sink. Throws std::runtime_error when
// the file cannot be opened.
class JsonLogger {
public:
    JsonLogger(std::filesystem::path path,
               bool mirror_stdout,
               std::size_t max_bytes_per_entry);

    // `fields` should be an object; anything else is stored under "value".
    // Records longer than the entry limit are replaced by a "logger.truncate" record.
    void event(std::string_view type, nlohmann::json fields);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    static std::string utc_timestamp();

private:
    std::string serialize(std::string_view type, const std::string& ts, nlohmann::json&& fields) const;

    std::filesystem::path path_;
    bool mirror_stdout_{true};
    std::size_t max_bytes_{0};

    std::mutex mutex_;
    std::ofstream file_;
};

}  // namespace hostprep::logging
