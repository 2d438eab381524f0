#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "core/config.hpp"

namespace converse {

namespace {

std::filesystem::path numbered_log(const std::filesystem::path& log_dir, int index) {
  return log_dir / ("converse." + std::to_string(index) + ".log");
}

// converse.log -> converse.0.log -> ... -> converse.{max_files-1}.log, oldest dropped
void rotate_logs_on_startup(const std::filesystem::path& log_dir, const std::filesystem::path& current_log,
                            size_t max_files) {
  namespace fs = std::filesystem;

  if (!fs::exists(current_log) || max_files == 0) {
    return;
  }

  std::error_code ec;
  fs::path oldest = numbered_log(log_dir, static_cast<int>(max_files) - 1);
  if (fs::exists(oldest)) {
    fs::remove(oldest, ec);
  }

  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    fs::path from = numbered_log(log_dir, i);
    if (fs::exists(from)) {
      fs::rename(from, numbered_log(log_dir, i + 1), ec);
    }
  }

  fs::rename(current_log, numbered_log(log_dir, 0), ec);
}

spdlog::level::level_enum parse_level(const std::string& level) {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "warn") return spdlog::level::warn;
  if (level == "err" || level == "error") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

}  // namespace

void init_log(const std::string& log_path, size_t /* max_size */, size_t max_files, const std::string& level) {
  try {
    namespace fs = std::filesystem;

    fs::path actual_path;
    if (log_path.empty()) {
      actual_path = config_paths::config_dir() / "log" / "converse.log";
    } else {
      actual_path = log_path;
    }
    fs::path log_dir = actual_path.parent_path();

    std::error_code ec;
    if (!log_dir.empty()) {
      fs::create_directories(log_dir, ec);
      if (ec) {
        std::cerr << "Failed to create log directory: " << ec.message() << "\n";
        return;
      }
    }

    rotate_logs_on_startup(log_dir, actual_path, max_files);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
    auto logger = std::make_shared<spdlog::logger>("converse", file_sink);

    logger->set_level(parse_level(level));

    // [time] [level] [thread] message
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    logger->flush_on(spdlog::level::trace);

    spdlog::drop("converse");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== converse started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace converse
