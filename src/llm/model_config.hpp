#pragma once

#include <optional>
#include <string>

#include "core/types.hpp"

namespace converse {

constexpr size_t kDefaultContextLimit = 200000;
constexpr double kDefaultEstimateFactor = 0.8;

// Model-specific settings and limits
struct ModelConfig {
  std::string model_name;
  std::string tokenizer_name;

  // Explicit values override model defaults
  std::optional<size_t> context_limit_override;
  std::optional<double> estimate_factor_override;
  std::optional<double> temperature;
  std::optional<int> max_tokens;

  // Ask for tool calls through the prompt and interpret free text
  bool toolshim = false;
  std::optional<std::string> toolshim_model;

  ModelConfig() = default;
  explicit ModelConfig(std::string name);

  ModelConfig& with_context_limit(std::optional<size_t> limit);
  ModelConfig& with_estimate_factor(std::optional<double> factor);
  ModelConfig& with_temperature(std::optional<double> temp);
  ModelConfig& with_max_tokens(std::optional<int> tokens);
  ModelConfig& with_toolshim(bool enabled, std::optional<std::string> model = std::nullopt);

  size_t context_limit() const;
  double estimate_factor() const;

  // context_limit() * estimate_factor()
  size_t estimated_limit() const;

  json to_json() const;
  static ModelConfig from_json(const json& j);

  // Known context windows keyed on model name fragments
  static std::optional<size_t> model_specific_limit(const std::string& model_name);
};

}  // namespace converse
