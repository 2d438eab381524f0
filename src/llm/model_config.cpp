#include "llm/model_config.hpp"

namespace converse {

namespace {

std::string infer_tokenizer_name(const std::string& model_name) {
  if (model_name.find("claude") != std::string::npos) {
    return "Xenova--claude-tokenizer";
  }
  return "Xenova--gpt-4o";
}

}  // namespace

ModelConfig::ModelConfig(std::string name)
    : model_name(std::move(name)),
      tokenizer_name(infer_tokenizer_name(model_name)),
      context_limit_override(model_specific_limit(model_name)) {}

std::optional<size_t> ModelConfig::model_specific_limit(const std::string& model_name) {
  auto has = [&model_name](const char* fragment) {
    return model_name.find(fragment) != std::string::npos;
  };

  if (has("gpt-4o") || has("gpt-4-turbo")) return 128000;
  if (has("claude-3")) return 200000;
  if (has("llama3.2") || has("llama3.3")) return 128000;
  return std::nullopt;
}

ModelConfig& ModelConfig::with_context_limit(std::optional<size_t> limit) {
  // None keeps the model default
  if (limit) {
    context_limit_override = limit;
  }
  return *this;
}

ModelConfig& ModelConfig::with_estimate_factor(std::optional<double> factor) {
  estimate_factor_override = factor;
  return *this;
}

ModelConfig& ModelConfig::with_temperature(std::optional<double> temp) {
  temperature = temp;
  return *this;
}

ModelConfig& ModelConfig::with_max_tokens(std::optional<int> tokens) {
  max_tokens = tokens;
  return *this;
}

ModelConfig& ModelConfig::with_toolshim(bool enabled, std::optional<std::string> model) {
  toolshim = enabled;
  toolshim_model = std::move(model);
  return *this;
}

size_t ModelConfig::context_limit() const {
  return context_limit_override.value_or(kDefaultContextLimit);
}

double ModelConfig::estimate_factor() const {
  return estimate_factor_override.value_or(kDefaultEstimateFactor);
}

size_t ModelConfig::estimated_limit() const {
  return static_cast<size_t>(static_cast<double>(context_limit()) * estimate_factor());
}

json ModelConfig::to_json() const {
  json j;
  j["model_name"] = model_name;
  j["tokenizer_name"] = tokenizer_name;
  if (context_limit_override) j["context_limit"] = *context_limit_override;
  if (estimate_factor_override) j["estimate_factor"] = *estimate_factor_override;
  if (temperature) j["temperature"] = *temperature;
  if (max_tokens) j["max_tokens"] = *max_tokens;
  j["toolshim"] = toolshim;
  if (toolshim_model) j["toolshim_model"] = *toolshim_model;
  return j;
}

ModelConfig ModelConfig::from_json(const json& j) {
  ModelConfig config(j.value("model_name", ""));
  if (j.contains("tokenizer_name")) {
    config.tokenizer_name = j["tokenizer_name"].get<std::string>();
  }
  if (j.contains("context_limit")) {
    config.context_limit_override = j["context_limit"].get<size_t>();
  }
  if (j.contains("estimate_factor")) {
    config.estimate_factor_override = j["estimate_factor"].get<double>();
  }
  if (j.contains("temperature")) {
    config.temperature = j["temperature"].get<double>();
  }
  if (j.contains("max_tokens")) {
    config.max_tokens = j["max_tokens"].get<int>();
  }
  config.toolshim = j.value("toolshim", false);
  if (j.contains("toolshim_model")) {
    config.toolshim_model = j["toolshim_model"].get<std::string>();
  }
  return config;
}

}  // namespace converse
