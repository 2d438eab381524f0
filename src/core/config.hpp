#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "types.hpp"

namespace converse {

// How standard tool requests are executed
enum class ExecutionMode {
  Auto,          // run everything
  Approve,       // ask before every tool not always-allowed
  SmartApprove,  // ask only for tools not annotated read-only
  Chat           // never run tools, describe them instead
};

std::string to_string(ExecutionMode mode);
std::optional<ExecutionMode> execution_mode_from_string(const std::string& str);

// Policy applied when the conversation no longer fits the context budget
enum class ContextStrategyKind {
  DropOldest,      // drop whole interactions, oldest first
  TrimResources,   // drop resource status items first, then interactions
  PassThrough      // never truncate ahead of the provider
};

std::string to_string(ContextStrategyKind kind);
std::optional<ContextStrategyKind> context_strategy_from_string(const std::string& str);

// Engine configuration, passed explicitly to Agent::create
struct EngineConfig {
  ExecutionMode mode = ExecutionMode::Auto;
  ContextStrategyKind context_strategy = ContextStrategyKind::TrimResources;

  // Context recovery after ContextLengthExceeded
  int max_truncation_attempts = 3;
  double estimate_factor_decay = 0.9;

  // Confirmation and frontend result channels
  size_t channel_capacity = 32;

  // Worker threads used to run tool calls
  size_t dispatch_threads = 4;

  // Upper bound on provider calls in one reply
  int max_turns = 1000;

  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file
  static EngineConfig load(const std::filesystem::path& path);

  // Load project config, then the global one, then defaults
  static EngineConfig load_default();

  // load_default() with CONVERSE_* environment overrides applied
  static EngineConfig from_env();

  static EngineConfig from_json(const json& j);
  json to_json() const;

  void save(const std::filesystem::path& path) const;
};

// Well-known paths
namespace config_paths {

std::filesystem::path home_dir();
std::filesystem::path config_dir();  // ~/.config/converse
std::filesystem::path default_config_file();
std::filesystem::path project_config_file();  // ./.converse/config.json

}  // namespace config_paths

}  // namespace converse
