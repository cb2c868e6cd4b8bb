#include "common/logger.hpp"

#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace dbsnap {

void init_default_logger(spdlog::level::level_enum level) {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stderr_color_mt(kLoggerName);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%n] [%^%l%$] %v");
    }
    logger->set_level(level);
    spdlog::set_default_logger(std::move(logger));
}

spdlog::level::level_enum parse_log_level(std::string_view name) {
    const std::string key{name};
    // from_str() answers "off" for names it does not know.
    const auto level = spdlog::level::from_str(key);
    if (level == spdlog::level::off && key != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace dbsnap
