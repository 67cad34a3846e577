// ============================================================================
// main.cpp — Entry point for the rulemap tool
// ============================================================================

#include "rulemap/cli.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    try {
        rulemap::Options opts = rulemap::parse_args(argc, argv);

        if (opts.help) {
            rulemap::print_usage(argv[0]);
            return 0;
        }

        return rulemap::run(opts);

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        rulemap::print_usage(argv[0]);
        return 1;
    }
}
