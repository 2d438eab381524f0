#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "context/token_counter.hpp"
#include "conversation/interaction.hpp"
#include "core/message.hpp"

namespace converse {

class ConversationError : public std::runtime_error {
 public:
  explicit ConversationError(const std::string& what) : std::runtime_error(what) {}
};

// Message history grouped into top-level QnA / BeginToolUse interactions
class Conversation {
 public:
  Conversation() = default;
  explicit Conversation(std::vector<Interaction> interactions) : interactions_(std::move(interactions)) {}

  // Throws ConversationError on a structurally invalid history
  static Conversation parse(const std::vector<Message>& messages, const TokenCounter& counter);

  // Flatten back to messages, never emitting two consecutive messages of one role
  std::vector<Message> render() const;

  const std::vector<Interaction>& interactions() const {
    return interactions_;
  }

  bool empty() const {
    return interactions_.empty();
  }

  size_t token_count() const;

 private:
  std::vector<Interaction> interactions_;
};

/**
 * Drop whole interactions, oldest first, until the history fits.
 *
 * @param messages history to shrink
 * @param approx_count current estimate of the full request (history, prompt, tools)
 * @param target_limit token budget
 * @return the rendered remainder; empty when nothing fits
 */
std::vector<Message> drop_messages(const std::vector<Message>& messages, size_t approx_count, size_t target_limit,
                                   const TokenCounter& counter);

}  // namespace converse
