// ============================================================================
// main.cpp — Entry point for the xi_attractor tool
// ============================================================================

#include "xi/cli.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    try {
        xi::Options opts = xi::parse_args(argc, argv);

        if (opts.help) {
            xi::print_usage(argv[0]);
            return 0;
        }

        return xi::run(opts);

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        xi::print_usage(argv[0]);
        return 1;
    }
}
