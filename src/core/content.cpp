#include "core/content.hpp"

namespace converse {

Content text_content(const std::string& text) {
  return TextContent{text};
}

std::string content_text(const Content& content) {
  if (auto* text = std::get_if<TextContent>(&content)) {
    return text->text;
  }
  return "";
}

json content_to_json(const Content& content) {
  json j;
  if (auto* text = std::get_if<TextContent>(&content)) {
    j["type"] = "text";
    j["text"] = text->text;
  } else if (auto* image = std::get_if<ImageContent>(&content)) {
    j["type"] = "image";
    j["data"] = image->data;
    j["mime_type"] = image->mime_type;
  }
  return j;
}

Content content_from_json(const json& j) {
  if (j.value("type", "text") == "image") {
    return ImageContent{j.value("data", ""), j.value("mime_type", "")};
  }
  return TextContent{j.value("text", "")};
}

json ToolCall::to_json() const {
  return {{"name", name}, {"arguments", arguments}};
}

ToolCall ToolCall::from_json(const json& j) {
  ToolCall call;
  call.name = j.value("name", "");
  if (j.contains("arguments")) {
    call.arguments = j["arguments"];
  }
  return call;
}

std::string to_string(ToolError::Kind kind) {
  switch (kind) {
    case ToolError::Kind::NotFound:
      return "not_found";
    case ToolError::Kind::InvalidParameters:
      return "invalid_parameters";
    case ToolError::Kind::ExecutionError:
      return "execution_error";
    case ToolError::Kind::SchemaError:
      return "schema_error";
  }
  return "execution_error";
}

ToolError::Kind tool_error_kind_from_string(const std::string& str) {
  if (str == "not_found") return ToolError::Kind::NotFound;
  if (str == "invalid_parameters") return ToolError::Kind::InvalidParameters;
  if (str == "schema_error") return ToolError::Kind::SchemaError;
  return ToolError::Kind::ExecutionError;
}

std::string ToolError::to_string() const {
  switch (kind) {
    case Kind::NotFound:
      return "Tool not found: " + message;
    case Kind::InvalidParameters:
      return "Invalid parameters: " + message;
    case Kind::ExecutionError:
      return "Execution failed: " + message;
    case Kind::SchemaError:
      return "Schema error: " + message;
  }
  return message;
}

json ToolError::to_json() const {
  return {{"kind", converse::to_string(kind)}, {"message", message}};
}

ToolError ToolError::from_json(const json& j) {
  return ToolError{tool_error_kind_from_string(j.value("kind", "execution_error")), j.value("message", "")};
}

json tool_output_to_json(const ToolOutput& output) {
  json j;
  if (output.ok()) {
    json items = json::array();
    for (const auto& content : *output.value) {
      items.push_back(content_to_json(content));
    }
    j["ok"] = items;
  } else if (output.error) {
    j["error"] = output.error->to_json();
  }
  return j;
}

ToolOutput tool_output_from_json(const json& j) {
  if (j.contains("error")) {
    return ToolOutput::failure(ToolError::from_json(j["error"]));
  }
  std::vector<Content> contents;
  if (j.contains("ok")) {
    for (const auto& item : j["ok"]) {
      contents.push_back(content_from_json(item));
    }
  }
  return ToolOutput::success(std::move(contents));
}

}  // namespace converse
