#include <subcmd/color.hpp>

using fmt::terminal_color;

namespace subcmd::color {
    auto paint(std::string_view text, terminal_color color) -> std::string {
        return fmt::format(fmt::fg(color), "{}", text);
    }

    auto bold(std::string_view text) -> std::string {
        return fmt::format(fmt::emphasis::bold, "{}", text);
    }

    auto black(std::string_view text) -> std::string {
        return paint(text, terminal_color::black);
    }

    auto red(std::string_view text) -> std::string {
        return paint(text, terminal_color::red);
    }

    auto green(std::string_view text) -> std::string {
        return paint(text, terminal_color::green);
    }

    auto yellow(std::string_view text) -> std::string {
        return paint(text, terminal_color::yellow);
    }

    auto blue(std::string_view text) -> std::string {
        return paint(text, terminal_color::blue);
    }

    auto magenta(std::string_view text) -> std::string {
        return paint(text, terminal_color::magenta);
    }

    auto cyan(std::string_view text) -> std::string {
        return paint(text, terminal_color::cyan);
    }

    auto white(std::string_view text) -> std::string {
        return paint(text, terminal_color::white);
    }
}
