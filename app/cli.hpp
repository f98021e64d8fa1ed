#pragma once

#include "decaf/config.hpp"

#include <optional>

namespace decaf::cli {

    // Fills `cfg` from argv. Returns an exit code when the process should stop here.
    std::optional<int> parse_cli(int argc, char** argv, server_config& cfg);

    int run_server(const server_config& cfg);

}  // namespace decaf::cli
