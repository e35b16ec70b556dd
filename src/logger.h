#ifndef __TB_LOGGER_H_
#define __TB_LOGGER_H_

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

#include "constants.h"

namespace tb::log {

/**
 * Create the "board_logger" rotating file logger writing to `filename` if it
 * doesn't exist yet and set its level to trace, or off when `use_logging` is false.
 */
void init_logger(bool use_logging, const std::string& filename = LOG_FILE);

/**
 * Unregister the "board_logger", board_logger() falls back to the default logger.
 */
void drop_logger();

/**
 * The "board_logger" if `init_logger` created it, else the default logger.
 */
std::shared_ptr<spdlog::logger> board_logger();

} // namespace tb::log

#endif
