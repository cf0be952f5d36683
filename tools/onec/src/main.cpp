// tools/onec/src/main.cpp
#include "cli/Options.hpp"
#include "driver/Runner.hpp"
#include <onec/Version.hpp>

#include <iostream>


int main(int argc, char** argv) {
    if (argc <= 1) {
        std::cout << onec::k_version_string << "\n";
        onec::cli::print_usage(std::cout);
        return 0;
    }

    const auto opt = onec::cli::parse_options(argc, argv);

    if (!opt.ok) {
        std::cerr << "error: " << opt.error << "\n";
        onec::cli::print_usage(std::cerr);
        return 1;
    }

    if (opt.mode == onec::cli::Mode::kVersion) {
        std::cout << onec::k_version_string << "\n";
        return 0;
    }

    if (opt.mode == onec::cli::Mode::kUsage) {
        onec::cli::print_usage(std::cout);
        return 0;
    }

    return onec::cli::run(opt);
}
