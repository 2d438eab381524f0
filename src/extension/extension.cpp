#include "extension/extension.hpp"

namespace converse {

Timestamp default_resource_timestamp() {
  return epoch_to_timestamp(1577836800);
}

FunctionExtension::FunctionExtension(std::string name, std::string instructions)
    : name_(std::move(name)), instructions_(std::move(instructions)) {}

FunctionExtension& FunctionExtension::add_tool(Tool tool, Handler handler) {
  tools_.push_back({std::move(tool), std::move(handler)});
  return *this;
}

FunctionExtension& FunctionExtension::add_resource(Resource resource, std::string content) {
  resources_.emplace_back(std::move(resource), std::move(content));
  return *this;
}

std::vector<Tool> FunctionExtension::tools() const {
  std::vector<Tool> result;
  result.reserve(tools_.size());
  for (const auto& entry : tools_) {
    result.push_back(entry.tool);
  }
  return result;
}

ToolOutput FunctionExtension::call_tool(const std::string& tool_name, const json& arguments) {
  for (const auto& entry : tools_) {
    if (entry.tool.name == tool_name) {
      return entry.handler(arguments);
    }
  }
  return ToolOutput::failure(ToolError::not_found(tool_name));
}

std::vector<Resource> FunctionExtension::list_resources() const {
  std::vector<Resource> result;
  for (const auto& [resource, content] : resources_) {
    result.push_back(resource);
  }
  return result;
}

Result<std::string, ToolError> FunctionExtension::read_resource(const std::string& uri) const {
  for (const auto& [resource, content] : resources_) {
    if (resource.uri == uri) {
      return Result<std::string, ToolError>::success(content);
    }
  }
  return Result<std::string, ToolError>::failure(ToolError::not_found("Resource not found: " + uri));
}

}  // namespace converse
