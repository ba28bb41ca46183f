#include "commands.h"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <timber/timber>

static auto $hello(const subcmd::context& ctx) -> void {
    TIMBER_DEBUG("Greeting {} name(s)", ctx.size());

    if (ctx.empty()) {
        fmt::print("Hello, world!\n");
        return;
    }

    fmt::print("Hello, {}!\n", fmt::join(ctx.args, " "));
}

namespace subcmd::cli {
    auto hello() -> command {
        return {
            .name = "hello",
            .usage = NAME " hello [name...]",
            .action = $hello
        };
    }
}
