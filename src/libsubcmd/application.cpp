#include <subcmd/application.hpp>
#include <subcmd/except.hpp>

#include <algorithm>
#include <iterator>
#include <timber/timber>

namespace {
    constexpr auto indent = std::string_view("    ");

    auto section(
        fmt::memory_buffer& buffer,
        std::string_view title,
        std::string_view body
    ) -> void {
        auto it = std::back_inserter(buffer);

        if (buffer.size() > 0) fmt::format_to(it, "\n");
        fmt::format_to(it, "{}:\n{}{}\n", title, indent, body);
    }
}

namespace subcmd {
    application::application(
        std::string_view name,
        std::string_view version,
        std::string_view usage
    ) :
        name(name),
        usage(usage),
        version(version)
    {}

    auto application::commands() const noexcept ->
        std::span<const subcmd::command>
    {
        return registry;
    }

    auto application::find(std::string_view name) const noexcept ->
        const subcmd::command*
    {
        for (const auto& command : registry) {
            if (command.name == name) return &command;
        }

        return nullptr;
    }

    auto application::help() const -> std::string {
        auto buffer = fmt::memory_buffer();
        auto it = std::back_inserter(buffer);

        if (!display_name.empty()) fmt::format_to(it, "{}\n", display_name);

        section(buffer, "Name", name);
        section(buffer, "Version", version);
        if (!description.empty()) section(buffer, "Description", description);
        section(buffer, "Usage", usage);

        if (registry.empty()) return fmt::to_string(buffer);

        auto width = std::size_t(0);
        for (const auto& command : registry) {
            width = std::max(width, command.name.size());
        }

        fmt::format_to(it, "\nCommands:\n");

        for (const auto& command : registry) {
            if (command.usage.empty()) {
                fmt::format_to(it, "{}{}\n", indent, command.name);
                continue;
            }

            fmt::format_to(
                it,
                "{}{:<{}}  {}\n",
                indent,
                command.name,
                width,
                command.usage
            );
        }

        return fmt::to_string(buffer);
    }

    auto application::help(std::ostream& out) const -> void {
        out << help() << std::flush;
    }

    auto application::run(
        std::span<const std::string> args,
        std::ostream& out
    ) const -> outcome {
        if (args.size() < 2) {
            TIMBER_DEBUG("{}: no subcommand given; showing help", name);

            help(out);
            return outcome::help;
        }

        const auto& token = args[1];
        const auto* command = find(token);

        if (!command) {
            TIMBER_DEBUG(
                R"({}: unknown subcommand "{}"; showing help)",
                name,
                token
            );

            help(out);
            return outcome::help;
        }

        const auto rest = args.subspan(2);

        TIMBER_DEBUG(
            R"({}: dispatching "{}" with {} argument{})",
            name,
            command->name,
            rest.size(),
            rest.size() == 1 ? "" : "s"
        );

        command->action(context(*this, rest));
        return outcome::dispatched;
    }

    auto application::run(
        int argc,
        const char* const* argv,
        std::ostream& out
    ) const -> outcome {
        auto args = std::vector<std::string>();
        args.reserve(argc);

        for (auto i = 0; i < argc; ++i) args.emplace_back(argv[i]);

        return run(args, out);
    }

    auto application::subcommand(subcmd::command command) -> application& {
        if (!command.action) {
            throw std::invalid_argument(fmt::format(
                R"(command "{}" has no action)",
                command.name
            ));
        }

        if (find(command.name)) throw duplicate_command(command.name);

        TIMBER_TRACE(R"({}: registered command "{}")", name, command.name);

        registry.push_back(std::move(command));
        return *this;
    }
}
