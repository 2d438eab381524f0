#include "conversation/interaction.hpp"

namespace converse {

std::string to_string(InteractionKind kind) {
  switch (kind) {
    case InteractionKind::QnA:
      return "qna";
    case InteractionKind::BeginToolUse:
      return "begin_tool_use";
    case InteractionKind::InsideToolUse:
      return "inside_tool_use";
    case InteractionKind::OutsideToolUse:
      return "outside_tool_use";
    case InteractionKind::Stub:
      return "stub";
  }
  return "stub";
}

void Interaction::record(const Message& message, const TokenCounter& counter) {
  if (!query) {
    query = message;
    token_count += counter.count_message(message);
    kind = InteractionKind::Stub;
  } else if (!reply) {
    reply = message;
    token_count += counter.count_message(message);
    kind = classify();
  }
}

void Interaction::add_linked(Interaction interaction) {
  token_count += interaction.token_count;
  linked.push_back(std::move(interaction));
}

std::optional<InteractionKind> Interaction::classify() const {
  if (!query || !reply) {
    return std::nullopt;
  }

  if (query->role() != Role::User || reply->role() != Role::Assistant) {
    return std::nullopt;
  }

  bool is_tool_response = query->has_tool_response();
  bool is_tool_request = reply->has_tool_request();

  if (!is_tool_response) {
    return is_tool_request ? InteractionKind::BeginToolUse : InteractionKind::QnA;
  }
  return is_tool_request ? InteractionKind::InsideToolUse : InteractionKind::OutsideToolUse;
}

}  // namespace converse
