#include <cstdlib>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "binchain/cli/commands.hpp"
#include "binchain/cli/config.hpp"
#include "binchain/cli/logging.hpp"
#include "binchain/errors.hpp"
#include "binchain/version.hpp"

namespace
{

    int dispatch(const binchain::cli::CliConfig &config)
    {
        using binchain::cli::Subcommand;

        switch (*config.command)
        {
        case Subcommand::Encode:
            return binchain::cli::run_encode(config.encode, std::cout);
        case Subcommand::Decode:
            return binchain::cli::run_decode(config.decode, std::cin, std::cout);
        case Subcommand::View:
            return binchain::cli::run_view(config.view, std::cout);
        case Subcommand::Send:
            return binchain::cli::run_send(config.send);
        case Subcommand::Receive:
            return binchain::cli::run_receive(config.receive);
        }
        return EXIT_FAILURE;
    }

} // namespace

int main(int argc, char *argv[])
{
    const std::string program_name = argc > 0 ? argv[0] : "binchain";

    binchain::cli::CliConfig config;
    try
    {
        config = binchain::cli::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << "\n\n"
                  << binchain::cli::usage(program_name);
        return EXIT_FAILURE;
    }

    if (config.show_help)
    {
        std::cout << "binchain " << binchain::version() << "\n"
                  << binchain::cli::usage(program_name);
        return EXIT_SUCCESS;
    }
    if (config.show_version)
    {
        std::cout << binchain::version() << '\n';
        return EXIT_SUCCESS;
    }

    try
    {
        binchain::cli::configure_logging(config.log_path, config.verbose);
        spdlog::debug("binchain {}", binchain::version());
        return dispatch(config);
    }
    catch (const binchain::Error &ex)
    {
        spdlog::error("{} ({})", ex.what(), binchain::to_string(ex.code()));
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }
}
