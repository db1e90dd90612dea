#include "hostprep/cli/parser.hpp"

#include <cstdlib>
#include <stdexcept>

#include <CLI11.hpp>

namespace hostprep::cli {

Options Parser::parse(int argc, char** argv) const {
    CLI::App app{"hostprep: prepares this Windows host and starts the monitoring stack"};

    Options options{};
    app.add_option("--config", options.profile, "JSON profile (default: hostprep.json beside the executable)")
        ->check(CLI::ExistingFile);
    app.add_option("--log", options.log_override, "Override JSONL log path");
    app.add_flag("--resumed", options.resumed, "Set by the logon resume entry after a restart");
    app.add_flag("--validate", options.validate_only, "Validate the profile and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    return options;
}

}  // namespace hostprep::cli
