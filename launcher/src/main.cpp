#include <cstdio>
#include <memory>

#include "hostprep/cli/parser.hpp"
#include "hostprep/host/clock.hpp"
#include "hostprep/host/host_environment.hpp"
#include "hostprep/launcher/bootstrap_app.hpp"

int main(int argc, char** argv) {
    hostprep::cli::Parser parser;

    try {
        auto options = parser.parse(argc, argv);
        std::unique_ptr<hostprep::host::HostEnvironment> host = hostprep::host::create_native_host();
        hostprep::host::SystemClock clock;
        hostprep::launcher::BootstrapApp app(*host, clock);
        return app.run(options);
    } catch (const std::exception& ex) {
        std::fprintf(stderr, "Error: %s\n", ex.what());
        return 1;
    }
}
