#include "context/token_counter.hpp"

namespace converse {

size_t ApproxTokenCounter::count_tokens(const std::string& text) const {
  return (text.size() + chars_per_token_ - 1) / chars_per_token_;
}

size_t TokenCounter::count_message(const Message& message) const {
  size_t count = kTokensPerMessage;

  for (const auto& part : message.parts()) {
    if (auto* text = std::get_if<TextPart>(&part)) {
      count += count_tokens(text->text);
    } else if (auto* req = std::get_if<ToolRequestPart>(&part)) {
      if (req->tool_call.ok()) {
        count += count_tokens(req->tool_call.value->name);
        count += count_tokens(req->tool_call.value->arguments.dump());
      }
    } else if (auto* resp = std::get_if<ToolResponsePart>(&part)) {
      if (resp->tool_result.ok()) {
        for (const auto& content : *resp->tool_result.value) {
          count += count_tokens(content_text(content));
        }
      } else if (resp->tool_result.error) {
        count += count_tokens(resp->tool_result.error->to_string());
      }
    }
  }

  return count;
}

size_t TokenCounter::count_tools(const std::vector<Tool>& tools) const {
  size_t count = 0;
  for (const auto& tool : tools) {
    count += kTokensPerTool;
    count += count_tokens(tool.name);
    count += count_tokens(tool.description);
    count += count_tokens(tool.input_schema.dump());
  }
  return count;
}

size_t TokenCounter::count_messages(const std::vector<Message>& messages) const {
  size_t count = 0;
  for (const auto& msg : messages) {
    count += count_message(msg);
  }
  return count;
}

size_t TokenCounter::count_everything(const std::string& system_prompt, const std::vector<Message>& messages,
                                      const std::vector<Tool>& tools, const std::vector<std::string>& resources) const {
  size_t count = count_tokens(system_prompt);
  count += count_messages(messages);
  count += count_tools(tools);
  for (const auto& resource : resources) {
    count += count_tokens(resource);
  }
  return count + kReplyPrimer;
}

}  // namespace converse
