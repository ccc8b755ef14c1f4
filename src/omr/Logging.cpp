#include "omr/Logging.hpp"
#include "omr/Errors.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace omr {

void setupLogging(const std::string& level) {
    const auto lvl = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (lvl == spdlog::level::off && level != "off")
        throw ConfigException("unknown log level '" + level + "'");

    auto logger = spdlog::get("omr");
    if (!logger) logger = spdlog::stdout_color_mt("omr");
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(lvl);
    spdlog::set_default_logger(logger);
}

}
