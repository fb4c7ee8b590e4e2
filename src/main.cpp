#include <iostream>
#include "cli/cli.hpp"

int main(int argc, char* argv[]) {
    plover::cli::Args args;
    try {
        args = plover::cli::parse_args(argc, argv);
    } catch (const plover::cli::UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n" << plover::cli::kUsage;
        return 1;
    }
    return plover::cli::run(args);
}
