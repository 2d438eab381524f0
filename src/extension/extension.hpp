#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/content.hpp"
#include "core/types.hpp"
#include "tool/tool.hpp"

namespace converse {

// Timestamp given to resources that do not report one (2020-01-01T00:00:00Z)
Timestamp default_resource_timestamp();

// A resource advertised by an extension
struct Resource {
  std::string uri;
  std::string name;
  std::string description;
  std::string mime_type = "text";
  double priority = 0.0;
  Timestamp timestamp = default_resource_timestamp();
};

// Resource content collected for the model's status context
struct ResourceItem {
  std::string extension;
  std::string uri;
  std::string name;
  std::string content;
  Timestamp timestamp = default_resource_timestamp();
  double priority = 0.0;
};

// What the system prompt needs to know about an enabled extension
struct ExtensionInfo {
  std::string name;
  std::string instructions;
  bool has_resources = false;
};

// In-process extension exposing tools and optionally resources
class Extension {
 public:
  virtual ~Extension() = default;

  virtual std::string name() const = 0;

  virtual std::string instructions() const {
    return "";
  }

  // Unprefixed tool definitions
  virtual std::vector<Tool> tools() const = 0;

  // May run concurrently with other calls; may throw
  virtual ToolOutput call_tool(const std::string& tool_name, const json& arguments) = 0;

  virtual bool supports_resources() const {
    return false;
  }

  virtual std::vector<Resource> list_resources() const {
    return {};
  }

  virtual Result<std::string, ToolError> read_resource(const std::string& uri) const {
    return Result<std::string, ToolError>::failure(ToolError::not_found("Resource not found: " + uri));
  }
};

// Extension whose tools are plain callables
class FunctionExtension : public Extension {
 public:
  using Handler = std::function<ToolOutput(const json& arguments)>;

  explicit FunctionExtension(std::string name, std::string instructions = "");

  FunctionExtension& add_tool(Tool tool, Handler handler);
  FunctionExtension& add_resource(Resource resource, std::string content);

  std::string name() const override {
    return name_;
  }

  std::string instructions() const override {
    return instructions_;
  }

  std::vector<Tool> tools() const override;

  ToolOutput call_tool(const std::string& tool_name, const json& arguments) override;

  bool supports_resources() const override {
    return !resources_.empty();
  }

  std::vector<Resource> list_resources() const override;

  Result<std::string, ToolError> read_resource(const std::string& uri) const override;

 private:
  struct Entry {
    Tool tool;
    Handler handler;
  };

  std::string name_;
  std::string instructions_;
  std::vector<Entry> tools_;
  std::vector<std::pair<Resource, std::string>> resources_;
};

}  // namespace converse
