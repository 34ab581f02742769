#pragma once

/**
 * @file Logging.h
 * @brief Library logger (spdlog)
 *
 * All VisMatch components log through one named logger so a host
 * application can raise or silence library output in one place.
 *
 * @code
 * Platform::SetLogLevel(spdlog::level::debug);
 * Platform::Logger()->info("matched {} candidates", n);
 * @endcode
 */

#include <VisMatch/Core/Export.h>

#include <memory>

#include <spdlog/spdlog.h>

namespace Vis::Match::Platform {

/// Logger name registered with spdlog
constexpr const char* LOGGER_NAME = "vismatch";

/**
 * @brief Get the library logger
 *
 * Created on first use with a colored stderr sink. If the host already
 * registered a logger named "vismatch", that logger is used instead.
 */
VISMATCH_API std::shared_ptr<spdlog::logger> Logger();

/**
 * @brief Set the library log level
 */
VISMATCH_API void SetLogLevel(spdlog::level::level_enum level);

} // namespace Vis::Match::Platform
