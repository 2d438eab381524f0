#include "tool/tool.hpp"

namespace converse {

json ParameterSchema::to_json_schema() const {
  json schema;
  schema["type"] = type;
  schema["description"] = description;

  if (default_value) {
    schema["default"] = *default_value;
  }

  if (enum_values && !enum_values->empty()) {
    schema["enum"] = *enum_values;
  }

  return schema;
}

Tool Tool::with_parameters(std::string name, std::string description, const std::vector<ParameterSchema>& params) {
  Tool tool;
  tool.name = std::move(name);
  tool.description = std::move(description);

  json properties = json::object();
  json required_props = json::array();

  for (const auto& param : params) {
    properties[param.name] = param.to_json_schema();
    if (param.required) {
      required_props.push_back(param.name);
    }
  }

  tool.input_schema = {{"type", "object"}, {"properties", properties}, {"required", required_props}};
  return tool;
}

json Tool::to_json_schema() const {
  json schema;
  schema["name"] = name;
  schema["description"] = description;
  schema["input_schema"] = input_schema;
  if (annotations) {
    schema["annotations"] = {{"read_only", annotations->read_only}, {"destructive", annotations->destructive}};
  }
  return schema;
}

Tool Tool::from_json(const json& j) {
  Tool tool;
  tool.name = j.value("name", "");
  tool.description = j.value("description", "");
  if (j.contains("input_schema")) {
    tool.input_schema = j["input_schema"];
  }
  if (j.contains("annotations")) {
    const auto& a = j["annotations"];
    tool.annotations = ToolAnnotations{a.value("read_only", false), a.value("destructive", false)};
  }
  return tool;
}

Result<json> Tool::validate_args(const json& args) const {
  if (!args.is_object()) {
    return Result<json>::failure("Arguments must be a JSON object");
  }

  if (input_schema.contains("required")) {
    for (const auto& required : input_schema["required"]) {
      auto param = required.get<std::string>();
      if (!args.contains(param)) {
        return Result<json>::failure("Missing required parameter: " + param);
      }
    }
  }

  return Result<json>::success(args);
}

}  // namespace converse
