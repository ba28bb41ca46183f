#include <subcmd/context.hpp>

namespace subcmd {
    context::context(
        const application& app,
        std::span<const std::string> args
    ) :
        app(app),
        args(args.begin(), args.end())
    {}

    auto context::arg(std::size_t index) const noexcept ->
        std::optional<std::string_view>
    {
        if (index >= args.size()) return std::nullopt;
        return args[index];
    }

    auto context::empty() const noexcept -> bool {
        return args.empty();
    }

    auto context::size() const noexcept -> std::size_t {
        return args.size();
    }
}
