#include "pomelo/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace pomelo {

void setupLogging(const std::string& level, bool access_log) {
    auto logger = spdlog::get("pomelo");
    if (!logger) {
        logger = spdlog::stdout_color_mt("pomelo");
    }
    logger->set_pattern(LOG_PATTERN);
    logger->set_level(spdlog::level::from_str(level));
    spdlog::set_default_logger(logger);

    auto access = spdlog::get(ACCESS_LOGGER_NAME);
    if (access_log) {
        if (!access) {
            access = spdlog::stdout_logger_mt(ACCESS_LOGGER_NAME);
        }
        access->set_pattern(ACCESS_LOG_PATTERN);
        access->set_level(spdlog::level::info);
    } else if (access) {
        spdlog::drop(ACCESS_LOGGER_NAME);
    }
}

std::shared_ptr<spdlog::logger> accessLogger() {
    return spdlog::get(ACCESS_LOGGER_NAME);
}

} // namespace pomelo
