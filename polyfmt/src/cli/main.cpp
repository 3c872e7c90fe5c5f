#include "cli/cmd_format.hpp"
#include "log/log.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    polyfmt::log::Logger::init(polyfmt::log::parse_log_options(argc, argv));

    auto options = polyfmt::cli::parse_format_args(argc, argv);
    if (polyfmt::is_err(options)) {
        std::cerr << "error: " << polyfmt::unwrap_err(options) << "\n";
        std::cerr << "Run 'polyfmt --help' for usage information.\n";
        return polyfmt::cli::EXIT_USAGE;
    }
    if (polyfmt::unwrap(options).help) {
        polyfmt::cli::print_usage(std::cout);
        return 0;
    }
    if (polyfmt::unwrap(options).version) {
        std::cout << "polyfmt " << polyfmt::VERSION << "\n";
        return 0;
    }

    int status = polyfmt::cli::run_format(polyfmt::unwrap(options), std::cout, std::cerr);
    polyfmt::log::Logger::instance().flush();
    return status;
}
