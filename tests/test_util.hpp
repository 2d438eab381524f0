#pragma once

#include <string>

#include "core/message.hpp"

namespace converse::test_util {

inline Message tool_request_message(const RequestId& id, const std::string& tool, const json& args = json::object(),
                                    const std::string& text = "") {
  Message message = Message::assistant(text);
  message.add_tool_request(id, ToolCallResult::success(ToolCall{tool, args}));
  return message;
}

inline Message tool_response_message(const RequestId& id, const std::string& text) {
  Message message = Message::user();
  message.add_tool_response(id, ToolOutput::success({text_content(text)}));
  return message;
}

inline std::string first_text(const ToolOutput& output) {
  if (!output.ok() || output.value->empty()) return "";
  return content_text(output.value->front());
}

}  // namespace converse::test_util
