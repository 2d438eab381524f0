#pragma once

#include <string>
#include <vector>

#include "core/content.hpp"
#include "core/message.hpp"
#include "core/types.hpp"
#include "tool/tool.hpp"

namespace converse {

// Rewrite the system prompt so a model without native tool calling emits JSON tool calls
std::string modify_system_prompt_for_tool_json(const std::string& system_prompt, const std::vector<Tool>& tools);

// Turns free text into structured tool calls
class ToolInterpreter {
 public:
  virtual ~ToolInterpreter() = default;

  virtual Result<std::vector<ToolCall>> interpret_to_tool_calls(const std::string& text,
                                                                const std::vector<Tool>& tools) = 0;
};

// Extracts {"name": ..., "arguments": {...}} objects (or tool/args) from fenced or bare JSON
class JsonToolInterpreter : public ToolInterpreter {
 public:
  Result<std::vector<ToolCall>> interpret_to_tool_calls(const std::string& text,
                                                        const std::vector<Tool>& tools) override;
};

// Append interpreted tool calls to a text-only response; error text on interpreter failure
Result<Message> augment_message_with_tool_calls(ToolInterpreter& interpreter, Message message,
                                                const std::vector<Tool>& tools);

}  // namespace converse
