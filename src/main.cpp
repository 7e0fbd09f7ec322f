// cppcheck-suppress-file missingIncludeSystem
#include <iostream>
#include <string>

#include "cli.hpp"
#include "commands_monitor.hpp"
#include "logging.hpp"

int main(int argc, char** argv)
{
    using namespace hostscope;

    const std::string program = argc > 0 ? argv[0] : "hostscope";
    auto options = parse_cli(argc, argv);
    if (!options) {
        logger().configure_from_env();
        logger().log(SLOG_ERROR("Invalid command line")
                         .field("error_code", error_code_name(options.error().code()))
                         .field("error", options.error().to_string()));
        std::cerr << usage_text(program);
        return 1;
    }
    if (options->show_help) {
        std::cout << usage_text(program);
        return 0;
    }

    apply_log_settings(options->log);
    return cmd_monitor(*options);
}
