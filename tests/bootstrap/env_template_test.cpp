#include <cassert>
#include <string>

#include "hostprep/bootstrap/env_template.hpp"
#include "hostprep/bootstrap/errors.hpp"
#include "hostprep/config/config_types.hpp"
#include "support/fake_host.hpp"

using hostprep::bootstrap::render_env_template;
using hostprep::bootstrap::template_values_for;
using hostprep::bootstrap::to_engine_mount_path;

namespace {

void translates_drive_paths() {
    assert(to_engine_mount_path("C:\\Users\\Alice") == "/host_mnt/c/Users/Alice");
    assert(to_engine_mount_path("D:/data/logs") == "/host_mnt/d/data/logs");
    assert(to_engine_mount_path("E:") == "/host_mnt/e/");
    assert(to_engine_mount_path("\\\\server\\share") == "//server/share");
}

void derives_log_directory_from_home() {
    hostprep::config::EnvironmentConfig config{};
    const auto values = template_values_for(config, "C:\\Users\\Alice", "Alice");
    assert(values.user_name == "Alice");
    assert(values.log_directory == "/host_mnt/c/Users/Alice/AppData/LocalLow/VRChat/VRChat");

    const auto trailing = template_values_for(config, "C:\\Users\\Alice\\", "Alice");
    assert(trailing.log_directory == values.log_directory);
}

void rewrites_only_recognised_lines() {
    hostprep::config::EnvironmentConfig config{};
    hostprep::bootstrap::TemplateValues values{"Alice", "/host_mnt/c/Users/Alice/logs"};

    const std::string input =
        "# InfluxDB\r\n"
        "INFLUXDB_TOKEN=secret\r\n"
        "HOST_USER=changeme\r\n"
        "  VRCHAT_LOG_DIR=changeme\r\n"
        "HOST_USERNAME=untouched\r\n"
        "TZ=Asia/Tokyo";
    const std::string expected =
        "# InfluxDB\r\n"
        "INFLUXDB_TOKEN=secret\r\n"
        "HOST_USER=Alice\r\n"
        "VRCHAT_LOG_DIR=/host_mnt/c/Users/Alice/logs\r\n"
        "HOST_USERNAME=untouched\r\n"
        "TZ=Asia/Tokyo";
    assert(render_env_template(input, config, values) == expected);
}

void first_line_after_byte_order_mark_is_rewritten() {
    hostprep::config::EnvironmentConfig config{};
    const auto values = template_values_for(config, "C:\\Users\\Alice", "Alice");

    const std::string input = "\xEF\xBB\xBFHOST_USER=changeme\r\nVRCHAT_LOG_DIR=x\r\n";
    const std::string expected =
        "\xEF\xBB\xBFHOST_USER=Alice\r\n"
        "VRCHAT_LOG_DIR=/host_mnt/c/Users/Alice/AppData/LocalLow/VRChat/VRChat\r\n";
    assert(render_env_template(input, config, values) == expected);
}

void rendering_is_idempotent() {
    hostprep::testing::ScopedTempDir dir;
    hostprep::config::EnvironmentConfig config{};
    const auto values = template_values_for(config, "C:\\Users\\Alice", "Alice");

    const auto template_file = dir.path() / ".env.example";
    const auto output = dir.path() / ".env";
    hostprep::testing::write_file(template_file, "HOST_USER=\nVRCHAT_LOG_DIR=\nGRAFANA_PORT=3000\n");
    hostprep::testing::write_file(output, "stale content that must disappear\n");

    hostprep::bootstrap::render_env_file(template_file, output, config, values);
    const std::string first = hostprep::testing::read_file(output);
    hostprep::bootstrap::render_env_file(template_file, output, config, values);
    assert(hostprep::testing::read_file(output) == first);
    assert(first ==
           "HOST_USER=Alice\n"
           "VRCHAT_LOG_DIR=/host_mnt/c/Users/Alice/AppData/LocalLow/VRChat/VRChat\n"
           "GRAFANA_PORT=3000\n");
}

void missing_template_is_fatal() {
    hostprep::testing::ScopedTempDir dir;
    hostprep::config::EnvironmentConfig config{};
    bool thrown = false;
    try {
        hostprep::bootstrap::render_env_file(dir.path() / "absent", dir.path() / ".env", config, {});
    } catch (const hostprep::bootstrap::BootstrapError& ex) {
        thrown = ex.kind() == hostprep::bootstrap::ErrorKind::TemplateMissing;
    }
    assert(thrown);
}

}  // namespace

int main() {
    translates_drive_paths();
    derives_log_directory_from_home();
    rewrites_only_recognised_lines();
    first_line_after_byte_order_mark_is_rewritten();
    rendering_is_idempotent();
    missing_template_is_fatal();
    return 0;
}
