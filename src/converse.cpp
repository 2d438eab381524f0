#include "converse.hpp"

#include <spdlog/spdlog.h>

#include "log/log.h"

namespace converse {

void init(const EngineConfig& config) {
  init_log(config.log_file ? config.log_file->string() : std::string(), 10 * 1024 * 1024, 10, config.log_level);
  spdlog::info("[converse] {} initialized (mode={}, context={})", version(), to_string(config.mode),
               to_string(config.context_strategy));
}

void shutdown() {
  spdlog::info("[converse] Shutting down");
  spdlog::shutdown();
}

std::string version() {
  return CONVERSE_VERSION_STRING;
}

}  // namespace converse
