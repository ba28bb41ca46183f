#include <subcmd/except.hpp>

#include <fmt/format.h>

namespace subcmd {
    duplicate_command::duplicate_command(std::string_view name) :
        std::runtime_error(fmt::format(
            R"(command "{}" is already registered)",
            name
        )),
        command_name(name)
    {}

    auto duplicate_command::name() const noexcept -> std::string_view {
        return command_name;
    }
}
