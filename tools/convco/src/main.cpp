// tools/convco/src/main.cpp
#include "driver/Runner.hpp"
#include <convco/Version.hpp>
#include <convco_tool/cli/Options.hpp>

#include <iostream>


int main(int argc, char** argv) {
    if (argc <= 1) {
        std::cout << convco::k_version_string << "\n";
        convco_tool::cli::print_usage(std::cout);
        return 0;
    }

    const auto opt = convco_tool::cli::parse_options(argc, argv);

    if (!opt.ok) {
        std::cerr << "error: " << opt.error << "\n";
        convco_tool::cli::print_usage(std::cerr);
        return 2;
    }

    if (opt.mode == convco_tool::cli::Mode::kVersion) {
        std::cout << convco::k_version_string << "\n";
        return 0;
    }

    if (opt.mode == convco_tool::cli::Mode::kUsage) {
        convco_tool::cli::print_usage(std::cout);
        return 0;
    }

    return convco_tool::driver::run(opt);
}
