#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace subcmd {
    class application;

    struct context {
        const application& app;
        std::vector<std::string> args;

        context(const application& app, std::span<const std::string> args);

        auto arg(std::size_t index) const noexcept ->
            std::optional<std::string_view>;

        auto empty() const noexcept -> bool;

        auto size() const noexcept -> std::size_t;
    };
}
