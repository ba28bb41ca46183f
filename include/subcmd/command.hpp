#pragma once

#include "context.hpp"

#include <functional>
#include <string>

namespace subcmd {
    using handler = std::function<void(const context&)>;

    struct command {
        std::string name;
        std::string usage;
        handler action;
    };
}
