#pragma once

#include <subcmd/application.hpp>

namespace subcmd::cli {
    auto hello() -> command;

    auto help() -> command;

    auto version() -> command;
}
