#pragma once
#include <spdlog/spdlog.h>

namespace tix::log {

constexpr const char* LOGGER_NAME = "tix";

/// Install the "tix" stderr logger as spdlog's default logger.
/// Safe to call more than once; later calls only adjust the level.
void init(spdlog::level::level_enum level = spdlog::level::info);

} // namespace tix::log
