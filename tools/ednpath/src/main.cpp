#include <ednpath/Version.hpp>
#include <ednpath/log/Log.hpp>
#include <ednpath_tool/cli/Options.hpp>
#include <ednpath_tool/driver/Driver.hpp>

#include <iostream>

int main(int argc, char** argv) {
    const auto opt = ednpath_tool::cli::parse_options(argc, argv);

    if (!opt.ok) {
        std::cerr << ednpath::log::paint("error: " + opt.error, ednpath::log::kAnsiRed) << "\n";
        ednpath_tool::cli::print_usage(std::cerr);
        return ednpath_tool::driver::kExitUsage;
    }

    if (opt.mode == ednpath_tool::cli::Mode::kVersion) {
        std::cout << ednpath::k_version_string << "\n";
        return 0;
    }

    if (opt.mode == ednpath_tool::cli::Mode::kUsage) {
        ednpath_tool::cli::print_usage(std::cout);
        return 0;
    }

    return ednpath_tool::driver::run(opt);
}
