#include "logger.h"

#include <fmt/format.h>

namespace subcmd::cli {
    auto console_logger(const timber::log& log) noexcept -> void {
        fmt::print(stderr, "[{}] {}\n", log.log_level, log.message);
    }
}
