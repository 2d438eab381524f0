#include "config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace converse {

namespace fs = std::filesystem;

std::string to_string(ExecutionMode mode) {
  switch (mode) {
    case ExecutionMode::Auto:
      return "auto";
    case ExecutionMode::Approve:
      return "approve";
    case ExecutionMode::SmartApprove:
      return "smart_approve";
    case ExecutionMode::Chat:
      return "chat";
  }
  return "auto";
}

std::optional<ExecutionMode> execution_mode_from_string(const std::string& str) {
  if (str == "auto") return ExecutionMode::Auto;
  if (str == "approve") return ExecutionMode::Approve;
  if (str == "smart_approve") return ExecutionMode::SmartApprove;
  if (str == "chat") return ExecutionMode::Chat;
  return std::nullopt;
}

std::string to_string(ContextStrategyKind kind) {
  switch (kind) {
    case ContextStrategyKind::DropOldest:
      return "drop_oldest";
    case ContextStrategyKind::TrimResources:
      return "trim_resources";
    case ContextStrategyKind::PassThrough:
      return "pass_through";
  }
  return "trim_resources";
}

std::optional<ContextStrategyKind> context_strategy_from_string(const std::string& str) {
  if (str == "drop_oldest") return ContextStrategyKind::DropOldest;
  if (str == "trim_resources") return ContextStrategyKind::TrimResources;
  if (str == "pass_through") return ContextStrategyKind::PassThrough;
  return std::nullopt;
}

EngineConfig EngineConfig::from_json(const json& j) {
  EngineConfig config;

  if (j.contains("mode")) {
    auto mode = execution_mode_from_string(j["mode"].get<std::string>());
    if (mode) {
      config.mode = *mode;
    } else {
      spdlog::warn("[Config] Unknown mode '{}', using {}", j["mode"].get<std::string>(), to_string(config.mode));
    }
  }

  if (j.contains("context_strategy")) {
    auto strategy = context_strategy_from_string(j["context_strategy"].get<std::string>());
    if (strategy) {
      config.context_strategy = *strategy;
    } else {
      spdlog::warn("[Config] Unknown context strategy '{}'", j["context_strategy"].get<std::string>());
    }
  }

  config.max_truncation_attempts = j.value("max_truncation_attempts", config.max_truncation_attempts);
  config.estimate_factor_decay = j.value("estimate_factor_decay", config.estimate_factor_decay);
  config.channel_capacity = j.value("channel_capacity", config.channel_capacity);
  config.dispatch_threads = j.value("dispatch_threads", config.dispatch_threads);
  config.max_turns = j.value("max_turns", config.max_turns);
  config.log_level = j.value("log_level", config.log_level);
  if (j.contains("log_file")) {
    config.log_file = j["log_file"].get<std::string>();
  }

  return config;
}

json EngineConfig::to_json() const {
  json j;
  j["mode"] = to_string(mode);
  j["context_strategy"] = to_string(context_strategy);
  j["max_truncation_attempts"] = max_truncation_attempts;
  j["estimate_factor_decay"] = estimate_factor_decay;
  j["channel_capacity"] = channel_capacity;
  j["dispatch_threads"] = dispatch_threads;
  j["max_turns"] = max_turns;
  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }
  return j;
}

EngineConfig EngineConfig::load(const fs::path& path) {
  if (!fs::exists(path)) {
    return EngineConfig{};
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("[Config] Cannot open {}", path.string());
    return EngineConfig{};
  }

  try {
    return from_json(json::parse(file));
  } catch (const std::exception& e) {
    spdlog::warn("[Config] Invalid config {}: {}", path.string(), e.what());
  }

  return EngineConfig{};
}

EngineConfig EngineConfig::load_default() {
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return EngineConfig{};
}

EngineConfig EngineConfig::from_env() {
  EngineConfig config = load_default();

  if (const char* mode = std::getenv("CONVERSE_MODE")) {
    if (auto parsed = execution_mode_from_string(mode)) {
      config.mode = *parsed;
    } else {
      spdlog::warn("[Config] Ignoring CONVERSE_MODE={}", mode);
    }
  }

  if (const char* strategy = std::getenv("CONVERSE_CONTEXT_STRATEGY")) {
    if (auto parsed = context_strategy_from_string(strategy)) {
      config.context_strategy = *parsed;
    } else {
      spdlog::warn("[Config] Ignoring CONVERSE_CONTEXT_STRATEGY={}", strategy);
    }
  }

  if (const char* attempts = std::getenv("CONVERSE_MAX_TRUNCATION_ATTEMPTS")) {
    try {
      config.max_truncation_attempts = std::stoi(attempts);
    } catch (const std::exception&) {
      spdlog::warn("[Config] Ignoring CONVERSE_MAX_TRUNCATION_ATTEMPTS={}", attempts);
    }
  }

  if (const char* level = std::getenv("CONVERSE_LOG_LEVEL")) {
    config.log_level = level;
  }

  return config;
}

void EngineConfig::save(const fs::path& path) const {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    spdlog::error("[Config] Cannot write {}", path.string());
    return;
  }
  file << to_json().dump(2);
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
#ifdef _WIN32
  const char* userprofile = std::getenv("USERPROFILE");
  if (userprofile) {
    return fs::path(userprofile);
  }
#endif
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "converse";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".converse" / "config.json";
}

}  // namespace config_paths

}  // namespace converse
