#include <subcmd/color.hpp>

#include <gtest/gtest.h>

namespace {
    constexpr auto reset = std::string_view("\x1b[0m");
}

TEST(Color, Paint) {
    EXPECT_EQ(
        "\x1b[31mtext\x1b[0m",
        subcmd::color::paint("text", fmt::terminal_color::red)
    );
}

TEST(Color, Named) {
    EXPECT_EQ("\x1b[30mx\x1b[0m", subcmd::color::black("x"));
    EXPECT_EQ("\x1b[31mx\x1b[0m", subcmd::color::red("x"));
    EXPECT_EQ("\x1b[32mx\x1b[0m", subcmd::color::green("x"));
    EXPECT_EQ("\x1b[33mx\x1b[0m", subcmd::color::yellow("x"));
    EXPECT_EQ("\x1b[34mx\x1b[0m", subcmd::color::blue("x"));
    EXPECT_EQ("\x1b[35mx\x1b[0m", subcmd::color::magenta("x"));
    EXPECT_EQ("\x1b[36mx\x1b[0m", subcmd::color::cyan("x"));
    EXPECT_EQ("\x1b[37mx\x1b[0m", subcmd::color::white("x"));
}

TEST(Color, Bold) {
    const auto text = subcmd::color::bold("banner");

    EXPECT_EQ("\x1b[1mbanner\x1b[0m", text);
    EXPECT_TRUE(text.ends_with(reset));
}

TEST(Color, KeepsText) {
    const auto text = subcmd::color::cyan("multi word banner");

    EXPECT_NE(std::string::npos, text.find("multi word banner"));
    EXPECT_TRUE(text.ends_with(reset));
}
