#ifndef CONVERSE_LOG_H
#define CONVERSE_LOG_H

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace converse {

/**
 * Initialize the file logger.
 *
 * Logs rotate once per startup:
 * - the previous converse.log is renamed to converse.0.log
 * - older files shift back: converse.0.log -> converse.1.log -> ... -> converse.{max_files-1}.log
 * - the oldest file is removed
 *
 * @param log_path log file path (defaults to ~/.config/converse/log/converse.log)
 * @param max_size unused, kept for a size based policy
 * @param max_files number of rotated files kept
 * @param level spdlog level name
 */
void init_log(const std::string& log_path = "", size_t max_size = 10 * 1024 * 1024, size_t max_files = 10,
              const std::string& level = "debug");

/**
 * Default logger
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace converse

#endif  // CONVERSE_LOG_H
