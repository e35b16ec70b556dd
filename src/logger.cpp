#include "logger.h"

#include <spdlog/sinks/rotating_file_sink.h>


namespace tb::log {

namespace {

inline constexpr auto LOGGER_NAME = "board_logger";

} // namespace

void init_logger(bool use_logging, const std::string& filename)
{
    auto logging_lvl = (use_logging) ? spdlog::level::trace : spdlog::level::off;
    auto logger = spdlog::get(LOGGER_NAME);
    if (logger.get() == nullptr) {
        logger = spdlog::rotating_logger_mt(LOGGER_NAME, filename, LOG_MAX_SIZE, LOG_MAX_FILES);
    }

    logger->set_level(logging_lvl);
}

void drop_logger()
{
    spdlog::drop(LOGGER_NAME);
}

std::shared_ptr<spdlog::logger> board_logger()
{
    auto logger = spdlog::get(LOGGER_NAME);
    if (logger.get() == nullptr) {
        return spdlog::default_logger();
    }
    return logger;
}

} // namespace tb::log
