#include "streamvault/Logging.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace StreamVault {

void Logging::initialize(const std::string& level, const std::string& pattern) {
    auto logger = spdlog::get("streamvault");
    if (!logger) {
        logger = spdlog::stdout_color_mt("streamvault");
    }
    if (!pattern.empty()) {
        logger->set_pattern(pattern);
    }
    logger->set_level(spdlog::level::from_str(level));
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);
}

void Logging::setLevel(const std::string& level) {
    spdlog::set_level(spdlog::level::from_str(level));
}

} // namespace StreamVault
