#include "cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        decaf::server_config cfg{};
        if (auto cli_result = decaf::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        return decaf::cli::run_server(cfg);
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
