#include "commands.h"
#include "logger.h"

#include <cstdlib>
#include <subcmd/color.hpp>
#include <timber/timber>

constexpr auto usage = std::string_view(NAME " [command] [args...]");

auto main(int argc, const char** argv) -> int {
    timber::reporting_level() = timber::level::info;
    timber::log_handler = &subcmd::cli::console_logger;

    auto app = subcmd::application(NAME, VERSION, usage);

    app.display_name = subcmd::color::bold(subcmd::color::cyan(NAME));
    app.description = "An example of a subcommand-driven program.";

    app
        .subcommand(subcmd::cli::hello())
        .subcommand(subcmd::cli::version())
        .subcommand(subcmd::cli::help());

    const auto result = app.run(argc, argv);
    TIMBER_DEBUG("{} finished: {}", app.name, result);

    return EXIT_SUCCESS;
}
