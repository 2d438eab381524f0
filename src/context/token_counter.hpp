#pragma once

#include <string>
#include <vector>

#include "core/message.hpp"
#include "tool/tool.hpp"

namespace converse {

// Approximate token accounting used for context budgeting
class TokenCounter {
 public:
  virtual ~TokenCounter() = default;

  virtual size_t count_tokens(const std::string& text) const = 0;

  // Text, tool request and tool response content of one message
  virtual size_t count_message(const Message& message) const;

  virtual size_t count_tools(const std::vector<Tool>& tools) const;

  size_t count_messages(const std::vector<Message>& messages) const;

  size_t count_everything(const std::string& system_prompt, const std::vector<Message>& messages,
                          const std::vector<Tool>& tools, const std::vector<std::string>& resources) const;

 protected:
  static constexpr size_t kTokensPerMessage = 4;
  static constexpr size_t kTokensPerTool = 8;
  static constexpr size_t kReplyPrimer = 3;
};

// ~4 characters per token
class ApproxTokenCounter : public TokenCounter {
 public:
  explicit ApproxTokenCounter(size_t chars_per_token = 4) : chars_per_token_(chars_per_token == 0 ? 1 : chars_per_token) {}

  size_t count_tokens(const std::string& text) const override;

 private:
  size_t chars_per_token_;
};

}  // namespace converse
