// ============================================================================
// main.cpp — Entry point for the proplogic tool
// ============================================================================

#include "proplogic/cli.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    try {
        proplogic::Options opts = proplogic::parse_args(argc, argv);

        if (opts.help) {
            proplogic::print_usage(argv[0]);
            return 0;
        }

        return proplogic::run(opts);

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        proplogic::print_usage(argv[0]);
        return 1;
    }
}
