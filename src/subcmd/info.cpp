#include "commands.h"

#include <fmt/format.h>
#include <iostream>

static auto $help(const subcmd::context& ctx) -> void {
    ctx.app.help(std::cout);
}

static auto $version(const subcmd::context& ctx) -> void {
    fmt::print("{} v{}\n", ctx.app.name, ctx.app.version);
}

namespace subcmd::cli {
    auto help() -> command {
        return {
            .name = "help",
            .usage = NAME " help",
            .action = $help
        };
    }

    auto version() -> command {
        return {
            .name = "version",
            .usage = NAME " version",
            .action = $version
        };
    }
}
