#include "hostprep/logging/json_logger.hpp"

#include <chrono>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

namespace hostprep::logging {

JsonLogger::JsonLogger(std::filesystem::path path,
                       bool mirror_stdout,
                       std::size_t max_bytes_per_entry)
    : path_(std::move(path)), mirror_stdout_(mirror_stdout), max_bytes_(max_bytes_per_entry) {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }
    file_.open(path_, std::ios::out | std::ios::app | std::ios::binary);
    if (!file_) {
        const std::u8string utf8 = path_.u8string();
        throw std::runtime_error("Cannot open log file " + std::string(utf8.begin(), utf8.end()));
    }
}

std::string JsonLogger::utc_timestamp() {
    using namespace std::chrono;
    const auto now = floor<milliseconds>(system_clock::now());
    const auto midnight = floor<days>(now);
    const year_month_day date{midnight};
    const hh_mm_ss time{now - midnight};

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                  static_cast<unsigned>(date.day()), static_cast<int>(time.hours().count()),
                  static_cast<int>(time.minutes().count()), static_cast<int>(time.seconds().count()),
                  static_cast<int>(time.subseconds().count()));
    return buffer;
}

std::string JsonLogger::serialize(std::string_view type, const std::string& ts, nlohmann::json&& fields) const {
    nlohmann::json record = nlohmann::json::object();
    if (fields.is_object()) {
        record = std::move(fields);
    } else if (!fields.is_null()) {
        record["value"] = std::move(fields);
    }
    record["ts"] = ts;
    record["type"] = std::string(type);

    // Child process output may not be valid UTF-8.
    std::string line = record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (max_bytes_ != 0 && line.size() > max_bytes_) {
        line = nlohmann::json{
            {"ts", ts},
            {"type", "logger.truncate"},
            {"original_type", std::string(type)},
            {"bytes", line.size()},
            {"max_bytes", max_bytes_}
        }.dump();
    }
    line.push_back('\n');
    return line;
}

void JsonLogger::event(std::string_view type, nlohmann::json fields) {
    const std::string line = serialize(type, utc_timestamp(), std::move(fields));

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << line;
        file_.flush();
    }
    if (mirror_stdout_) {
        std::cout << line << std::flush;
    }
}

}  // namespace hostprep::logging
