#pragma once

#include "hostprep/cli/cli_options.hpp"

namespace hostprep::cli {

class Parser {
public:
    Options parse(int argc, char** argv) const;
};

}  // namespace hostprep::cli
