#include "conversation/conversation.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace converse {

Conversation Conversation::parse(const std::vector<Message>& messages, const TokenCounter& counter) {
  if (messages.empty()) {
    throw ConversationError("Conversation cannot be empty");
  }

  if (messages.front().role() != Role::User) {
    throw ConversationError("First message must be from User");
  }

  std::vector<Interaction> interactions;
  std::optional<size_t> head;
  Interaction current;

  for (size_t i = 0; i < messages.size(); ++i) {
    const auto& msg = messages[i];
    bool is_last = i + 1 == messages.size();

    if (i > 0 && msg.role() == messages[i - 1].role()) {
      throw ConversationError("Speaker roles must alternate");
    }

    current.record(msg, counter);
    if (!current.kind) {
      throw ConversationError("Speaker roles must alternate");
    }

    switch (*current.kind) {
      case InteractionKind::QnA:
      case InteractionKind::BeginToolUse:
        interactions.push_back(std::move(current));
        head = interactions.size() - 1;
        current = Interaction{};
        break;

      case InteractionKind::Stub:
        if (is_last) {
          // A trailing query with nothing to chain to stands alone
          if (head) {
            interactions[*head].add_linked(std::move(current));
          } else {
            interactions.push_back(std::move(current));
          }
          current = Interaction{};
        }
        break;

      case InteractionKind::InsideToolUse:
      case InteractionKind::OutsideToolUse:
        if (!head) {
          throw ConversationError("First interaction must be QnA or BeginToolUse");
        }
        interactions[*head].add_linked(std::move(current));
        current = Interaction{};
        break;
    }
  }

  return Conversation(std::move(interactions));
}

std::vector<Message> Conversation::render() const {
  std::vector<Message> messages;
  std::optional<Role> last_role;

  auto emit = [&](const std::optional<Message>& msg) {
    if (msg && last_role != msg->role()) {
      messages.push_back(*msg);
      last_role = msg->role();
    }
  };

  for (const auto& interaction : interactions_) {
    emit(interaction.query);
    emit(interaction.reply);
    for (const auto& linked : interaction.linked) {
      emit(linked.query);
      emit(linked.reply);
    }
  }

  return messages;
}

size_t Conversation::token_count() const {
  size_t total = 0;
  for (const auto& interaction : interactions_) {
    total += interaction.token_count;
  }
  return total;
}

std::vector<Message> drop_messages(const std::vector<Message>& messages, size_t approx_count, size_t target_limit,
                                   const TokenCounter& counter) {
  spdlog::debug("[Conversation] History of ~{} tokens exceeds budget {}, dropping oldest interactions", approx_count,
                target_limit);

  Conversation conversation;
  try {
    conversation = Conversation::parse(messages, counter);
  } catch (const ConversationError& e) {
    spdlog::warn("[Conversation] Cannot truncate malformed history: {}", e.what());
    return {};
  }

  std::vector<Interaction> interactions = conversation.interactions();
  size_t running = approx_count;

  // An oversized newest interaction cannot be shrunk, drop it entirely
  if (!interactions.empty() && interactions.back().token_count > target_limit) {
    spdlog::warn("[Conversation] Newest interaction ({} tokens) exceeds budget {}", interactions.back().token_count,
                 target_limit);
    running -= std::min(running, interactions.back().token_count);
    interactions.pop_back();
  }

  size_t keep = interactions.size();
  for (size_t i = 0; i < interactions.size(); ++i) {
    if (running <= target_limit) {
      keep = i;
      break;
    }
    running -= std::min(running, interactions[i].token_count);
  }

  std::vector<Interaction> kept(std::make_move_iterator(interactions.begin() + static_cast<std::ptrdiff_t>(keep)),
                                std::make_move_iterator(interactions.end()));

  auto result = Conversation(std::move(kept)).render();
  spdlog::debug("[Conversation] Kept {} of {} messages", result.size(), messages.size());
  return result;
}

}  // namespace converse
