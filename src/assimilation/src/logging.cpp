/**
 * @file logging.cpp
 * @brief Logger setup and message packing
 */

#include "logging.hpp"

namespace driftda {

void init_logging(spdlog::level::level_enum level) {
    spdlog::set_pattern("[%n %l] %v");
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
}

std::string pack_log_message(const char* file, int line, const std::string& msg) {
    const std::string path(file);
    const size_t pos = path.find_last_of("\\/");
    const std::string base = (pos != std::string::npos) ? path.substr(pos + 1) : path;

    return "[" + base + ":" + std::to_string(line) + "] " + msg;
}

} // namespace driftda
