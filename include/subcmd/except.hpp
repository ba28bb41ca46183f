#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace subcmd {
    struct duplicate_command : std::runtime_error {
        explicit duplicate_command(std::string_view name);

        auto name() const noexcept -> std::string_view;
    private:
        std::string command_name;
    };
}
