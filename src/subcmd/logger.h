#pragma once

#include <timber/timber>

namespace subcmd::cli {
    auto console_logger(const timber::log& log) noexcept -> void;
}
