/**
 * @file Logging.cpp
 * @brief Library logger implementation
 */

#include <VisMatch/Platform/Logging.h>

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace Vis::Match::Platform {

std::shared_ptr<spdlog::logger> Logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> logger;

    std::call_once(once, [] {
        logger = spdlog::get(LOGGER_NAME);
        if (!logger) {
            logger = spdlog::stderr_color_mt(LOGGER_NAME);
            logger->set_level(spdlog::level::info);
        }
    });
    return logger;
}

void SetLogLevel(spdlog::level::level_enum level) {
    Logger()->set_level(level);
}

} // namespace Vis::Match::Platform
