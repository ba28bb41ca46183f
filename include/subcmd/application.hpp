#pragma once

#include "command.hpp"

#include <fmt/format.h>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace subcmd {
    enum class outcome {
        dispatched,
        help
    };

    class application {
        std::vector<subcmd::command> registry;
    public:
        std::string name;
        std::string display_name;
        std::string usage;
        std::string version;
        std::string description;

        application(
            std::string_view name,
            std::string_view version,
            std::string_view usage
        );

        auto commands() const noexcept -> std::span<const subcmd::command>;

        auto find(std::string_view name) const noexcept ->
            const subcmd::command*;

        auto help() const -> std::string;

        auto help(std::ostream& out) const -> void;

        /**
         * Dispatches on args[1], where args[0] is the program path. The
         * matched action receives args[2:]. When no subcommand is given, or
         * none matches, the help text is written to 'out' instead.
         *
         * Exceptions thrown by the action are not caught.
         */
        auto run(
            std::span<const std::string> args,
            std::ostream& out = std::cout
        ) const -> outcome;

        auto run(
            int argc,
            const char* const* argv,
            std::ostream& out = std::cout
        ) const -> outcome;

        auto subcommand(subcmd::command command) -> application&;
    };
}

template <>
struct fmt::formatter<subcmd::outcome> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(subcmd::outcome outcome, FormatContext& ctx) const {
        auto name = std::string_view("unknown");

        switch (outcome) {
            case subcmd::outcome::dispatched: name = "dispatched"; break;
            case subcmd::outcome::help: name = "help"; break;
        }

        return formatter<std::string_view>::format(name, ctx);
    }
};
