/**
 * @file logging.hpp
 * @brief Logging macros on top of spdlog
 *
 * Messages are formatted with fmt and prefixed with [file:line]. Formatting
 * is skipped when the default logger would drop the level.
 */

#ifndef DRIFTDA_LOGGING_HPP
#define DRIFTDA_LOGGING_HPP

#include <spdlog/spdlog.h>
#include <string>

#define DRIFTDA_LOG_AT(level, msg, ...)                                        \
    do {                                                                       \
        if (spdlog::should_log(level)) {                                       \
            spdlog::log(level, driftda::pack_log_message(                      \
                __FILE__, __LINE__, fmt::format(msg, ##__VA_ARGS__)));         \
        }                                                                      \
    } while (0)

#define DRIFTDA_LOG_TRACE(msg, ...) DRIFTDA_LOG_AT(spdlog::level::trace, msg, ##__VA_ARGS__)
#define DRIFTDA_LOG_DEBUG(msg, ...) DRIFTDA_LOG_AT(spdlog::level::debug, msg, ##__VA_ARGS__)
#define DRIFTDA_LOG_INFO(msg, ...)  DRIFTDA_LOG_AT(spdlog::level::info, msg, ##__VA_ARGS__)
#define DRIFTDA_LOG_WARN(msg, ...)  DRIFTDA_LOG_AT(spdlog::level::warn, msg, ##__VA_ARGS__)
#define DRIFTDA_LOG_ERROR(msg, ...) DRIFTDA_LOG_AT(spdlog::level::err, msg, ##__VA_ARGS__)

namespace driftda {

/**
 * @brief Set the default logger pattern and runtime level
 * @param level spdlog level (trace, debug, info, warn, err, critical, off)
 */
void init_logging(spdlog::level::level_enum level = spdlog::level::info);

/**
 * @brief Prefix a message with the basename of file and the line number
 */
std::string pack_log_message(const char* file, int line, const std::string& msg);

} // namespace driftda

#endif // DRIFTDA_LOGGING_HPP
