#include "log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

void init_logging(bool verbose) {
    auto logger = spdlog::get("tabdeck");
    if (!logger) logger = spdlog::stdout_color_mt("tabdeck");

    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_default_logger(logger);
}
