#pragma once

#include <string>
#include <variant>
#include <vector>

#include "core/types.hpp"

namespace converse {

// Tool output content
struct TextContent {
  std::string text;
};

struct ImageContent {
  std::string data;  // base64
  std::string mime_type;
};

using Content = std::variant<TextContent, ImageContent>;

Content text_content(const std::string& text);

// Text of a content item, empty for images
std::string content_text(const Content& content);

json content_to_json(const Content& content);
Content content_from_json(const json& j);

// A model-issued invocation of a named tool
struct ToolCall {
  std::string name;
  json arguments = json::object();

  json to_json() const;
  static ToolCall from_json(const json& j);
};

// Tool-level failure, reported back to the model as conversation content
struct ToolError {
  enum class Kind { NotFound, InvalidParameters, ExecutionError, SchemaError };

  Kind kind = Kind::ExecutionError;
  std::string message;

  static ToolError not_found(std::string msg) {
    return ToolError{Kind::NotFound, std::move(msg)};
  }

  static ToolError invalid_parameters(std::string msg) {
    return ToolError{Kind::InvalidParameters, std::move(msg)};
  }

  static ToolError execution(std::string msg) {
    return ToolError{Kind::ExecutionError, std::move(msg)};
  }

  std::string to_string() const;
  json to_json() const;
  static ToolError from_json(const json& j);
};

std::string to_string(ToolError::Kind kind);
ToolError::Kind tool_error_kind_from_string(const std::string& str);

using ToolCallResult = Result<ToolCall, ToolError>;
using ToolOutput = Result<std::vector<Content>, ToolError>;

json tool_output_to_json(const ToolOutput& output);
ToolOutput tool_output_from_json(const json& j);

}  // namespace converse
