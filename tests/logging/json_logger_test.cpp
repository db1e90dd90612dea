#include <cassert>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hostprep/logging/json_logger.hpp"
#include "support/fake_host.hpp"

using hostprep::logging::JsonLogger;
using hostprep::testing::read_file;
using hostprep::testing::ScopedTempDir;

namespace {

std::vector<nlohmann::json> read_records(const std::filesystem::path& path) {
    std::vector<nlohmann::json> records;
    std::istringstream stream(read_file(path));
    std::string line;
    while (std::getline(stream, line)) {
        records.push_back(nlohmann::json::parse(line));
    }
    return records;
}

void records_carry_timestamp_and_type() {
    ScopedTempDir dir;
    const auto path = dir.path() / "nested" / "hostprep.jsonl";
    {
        JsonLogger logger(path, false, 0);
        assert(logger.path() == path);
        logger.event("stage.ensure", {{"copied", true}});
        logger.event("engine.poll", 3);
        logger.event("run.complete", nullptr);
    }

    const auto records = read_records(path);
    assert(records.size() == 3);
    assert(records[0]["type"] == "stage.ensure");
    assert(records[0]["copied"] == true);
    assert(records[1]["value"] == 3);
    assert(records[2].size() == 2);

    const std::string ts = records[0]["ts"].get<std::string>();
    assert(ts.size() == 24);
    assert(ts[4] == '-' && ts[10] == 'T' && ts[19] == '.' && ts.back() == 'Z');
}

void appends_across_instances() {
    ScopedTempDir dir;
    const auto path = dir.path() / "hostprep.jsonl";
    JsonLogger(path, false, 0).event("run.start", {{"resumed", false}});
    JsonLogger(path, false, 0).event("run.start", {{"resumed", true}});

    const auto records = read_records(path);
    assert(records.size() == 2);
    assert(records[1]["resumed"] == true);
}

void oversize_records_are_replaced() {
    ScopedTempDir dir;
    const auto path = dir.path() / "hostprep.jsonl";
    JsonLogger logger(path, false, 128);
    logger.event("engine.probe", {{"output", std::string(512, 'x')}});

    const auto records = read_records(path);
    assert(records.size() == 1);
    assert(records[0]["type"] == "logger.truncate");
    assert(records[0]["original_type"] == "engine.probe");
    assert(records[0]["max_bytes"] == 128);
    assert(records[0]["bytes"].get<std::size_t>() > 512);
}

void invalid_utf8_is_replaced() {
    ScopedTempDir dir;
    const auto path = dir.path() / "hostprep.jsonl";
    JsonLogger(path, false, 0).event("stack.clone", {{"output", std::string("caf\xE9")}});

    const auto records = read_records(path);
    assert(records.size() == 1);
    assert(records[0]["output"].get<std::string>().rfind("caf", 0) == 0);
}

void unopenable_file_throws() {
    ScopedTempDir dir;
    bool thrown = false;
    try {
        JsonLogger logger(dir.path(), false, 0);
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    JsonLogger disabled({}, false, 0);
    disabled.event("run.start", nullptr);
}

}  // namespace

int main() {
    records_carry_timestamp_and_type();
    appends_across_instances();
    oversize_records_are_replaced();
    invalid_utf8_is_replaced();
    unopenable_file_throws();
    return 0;
}
