#pragma once

#include <optional>
#include <string>
#include <vector>

#include "context/token_counter.hpp"
#include "core/message.hpp"

namespace converse {

// Shape of one user/assistant exchange
enum class InteractionKind {
  QnA,             // plain question and answer
  BeginToolUse,    // answer opens a tool-use chain
  InsideToolUse,   // tool result answered with another tool request
  OutsideToolUse,  // tool result answered in plain text, chain closed
  Stub             // query without a reply yet
};

std::string to_string(InteractionKind kind);

// One query/reply pair plus the tool-use exchanges chained to it
struct Interaction {
  std::optional<Message> query;
  std::optional<Message> reply;
  size_t token_count = 0;
  std::optional<InteractionKind> kind;
  std::vector<Interaction> linked;

  // First call stores the query, second the reply; later calls are ignored
  void record(const Message& message, const TokenCounter& counter);

  // Adds a chained exchange; its tokens count towards this interaction
  void add_linked(Interaction interaction);

  std::optional<InteractionKind> classify() const;
};

}  // namespace converse
