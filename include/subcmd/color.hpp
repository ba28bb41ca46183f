#pragma once

#include <fmt/color.h>
#include <string>
#include <string_view>

namespace subcmd::color {
    auto paint(std::string_view text, fmt::terminal_color color) -> std::string;

    auto bold(std::string_view text) -> std::string;

    auto black(std::string_view text) -> std::string;
    auto red(std::string_view text) -> std::string;
    auto green(std::string_view text) -> std::string;
    auto yellow(std::string_view text) -> std::string;
    auto blue(std::string_view text) -> std::string;
    auto magenta(std::string_view text) -> std::string;
    auto cyan(std::string_view text) -> std::string;
    auto white(std::string_view text) -> std::string;
}
