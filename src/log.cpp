#include "tix/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tix::log {

void init(spdlog::level::level_enum level) {
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        spdlog::set_default_logger(existing);
    } else {
        auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
        spdlog::set_default_logger(logger);
    }
    spdlog::set_level(level);
}

} // namespace tix::log
