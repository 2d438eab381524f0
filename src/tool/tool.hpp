#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace converse {

// Parameter schema (simplified JSON Schema)
struct ParameterSchema {
  std::string name;
  std::string type;  // "string", "number", "boolean", "object", "array"
  std::string description;
  bool required = true;
  std::optional<json> default_value;
  std::optional<std::vector<std::string>> enum_values;

  json to_json_schema() const;
};

// Behavioural hints published with a tool
struct ToolAnnotations {
  bool read_only = false;
  bool destructive = false;
};

// Tool definition as advertised to the model
struct Tool {
  std::string name;
  std::string description;
  json input_schema = {{"type", "object"}, {"properties", json::object()}, {"required", json::array()}};
  std::optional<ToolAnnotations> annotations;

  // Build a tool from a flat parameter list
  static Tool with_parameters(std::string name, std::string description, const std::vector<ParameterSchema>& params);

  bool is_read_only() const {
    return annotations && annotations->read_only;
  }

  // {name, description, input_schema}
  json to_json_schema() const;
  static Tool from_json(const json& j);

  // Checks required parameters are present
  Result<json> validate_args(const json& args) const;
};

}  // namespace converse
