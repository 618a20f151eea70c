#ifndef SSEBRIDGE_LOG_H
#define SSEBRIDGE_LOG_H

#include <spdlog/common.h>

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace ssebridge {

/**
 * Initialize logging.
 *
 * @param level    trace, debug, info, warn, err, critical or off (unknown values mean info)
 * @param log_path Log file path. Empty logs to stderr; a file is truncated on every start.
 */
void init_log(const std::string& level = "info", const std::string& log_path = "");

spdlog::level::level_enum parse_log_level(const std::string& level);

/**
 * Default logger
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace ssebridge

#endif  // SSEBRIDGE_LOG_H
