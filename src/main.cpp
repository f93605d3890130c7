#include <iostream>

#include <spdlog/spdlog.h>

#include "cli/commands.h"
#include "utils/cli.h"
#include "utils/logger.h"

int main(int argc, char* argv[]) {
    // Parse CLI arguments first
    auto cli_result = loradeck::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }

    loradeck::logger::init_from_env();

    try {
        switch (cli_result.subcommand) {
            case loradeck::Subcommand::Scan:
                return loradeck::cli::commands::scan(cli_result.scan_options, std::cout);

            case loradeck::Subcommand::Classify:
                return loradeck::cli::commands::classify(cli_result.classify_options, std::cout);

            case loradeck::Subcommand::None:
            default:
                std::cerr << loradeck::getHelpMessage();
                return 1;
        }
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", loradeck::subcommandToString(cli_result.subcommand), e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
