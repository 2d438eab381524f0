#include "context/context_strategy.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <sstream>

#include "conversation/conversation.hpp"

namespace converse {

namespace {

constexpr double kPriorityEpsilon = 0.001;

std::vector<std::string> resource_contents(const std::vector<ResourceItem>& items) {
  std::vector<std::string> contents;
  contents.reserve(items.size());
  for (const auto& item : items) {
    contents.push_back(item.content);
  }
  return contents;
}

Result<std::vector<Message>> fit_history(const std::vector<Message>& history, size_t approx_count,
                                         size_t target_limit, const TokenCounter& counter) {
  auto truncated = drop_messages(history, approx_count, target_limit, counter);
  if (truncated.empty()) {
    return Result<std::vector<Message>>::failure("The context limit of " + std::to_string(target_limit) +
                                                 " tokens cannot be satisfied");
  }
  return Result<std::vector<Message>>::success(std::move(truncated));
}

Result<std::vector<Message>> drop_oldest_interaction(const std::vector<Message>& history, const TokenCounter& counter) {
  Conversation conversation;
  try {
    conversation = Conversation::parse(history, counter);
  } catch (const ConversationError& e) {
    return Result<std::vector<Message>>::failure(std::string("Cannot truncate malformed history: ") + e.what());
  }

  const auto& interactions = conversation.interactions();
  if (interactions.size() < 2) {
    return Result<std::vector<Message>>::failure("No older interactions left to drop");
  }

  std::vector<Interaction> kept(interactions.begin() + 1, interactions.end());
  spdlog::debug("[Context] History fits the estimate, dropping the oldest of {} interactions", interactions.size());
  return Result<std::vector<Message>>::success(Conversation(std::move(kept)).render());
}

}  // namespace

Result<PreparedContext> PassThroughStrategy::prepare(ContextInput input, const TokenCounter& /* counter */) const {
  return Result<PreparedContext>::success(PreparedContext{input.history, input.history, false});
}

Result<PreparedContext> DropOldestInteractionsStrategy::prepare(ContextInput input, const TokenCounter& counter) const {
  auto approx_count = counter.count_everything(input.system_prompt, input.history, input.tools, {});
  if (approx_count <= input.target_limit) {
    return Result<PreparedContext>::success(PreparedContext{input.history, input.history, false});
  }

  auto fitted = fit_history(input.history, approx_count, input.target_limit, counter);
  if (!fitted.ok()) {
    return Result<PreparedContext>::failure(*fitted.error);
  }
  auto& history = *fitted.value;
  return Result<PreparedContext>::success(PreparedContext{history, history, true});
}

Result<PreparedContext> TrimResourcesStrategy::prepare(ContextInput input, const TokenCounter& counter) const {
  auto& items = input.resources;
  auto approx_count = counter.count_everything(input.system_prompt, input.history, input.tools, resource_contents(items));

  PreparedContext prepared{input.history, {}, false};

  if (approx_count > input.target_limit) {
    sort_resources_by_importance(items);
    while (!items.empty() && approx_count > input.target_limit) {
      auto dropped = counter.count_tokens(items.back().content);
      spdlog::debug("[Context] Dropping resource {} ({} tokens)", items.back().uri, dropped);
      approx_count -= std::min(approx_count, dropped);
      items.pop_back();
    }
  }

  if (approx_count > input.target_limit) {
    auto fitted = fit_history(input.history, approx_count, input.target_limit, counter);
    if (!fitted.ok()) {
      return Result<PreparedContext>::failure(*fitted.error);
    }
    prepared.history = std::move(*fitted.value);
    prepared.truncated = true;
  }

  prepared.provider_messages = prepared.history;
  if (!items.empty()) {
    if (!prepared.history.empty() && prepared.history.back().role() == Role::User) {
      auto status = render_status_messages(items);
      prepared.provider_messages.insert(prepared.provider_messages.end(), status.begin(), status.end());
    } else {
      spdlog::debug("[Context] History does not end with a user message, status context omitted");
    }
  }

  return Result<PreparedContext>::success(std::move(prepared));
}

std::unique_ptr<ContextStrategy> make_context_strategy(ContextStrategyKind kind) {
  switch (kind) {
    case ContextStrategyKind::DropOldest:
      return std::make_unique<DropOldestInteractionsStrategy>();
    case ContextStrategyKind::TrimResources:
      return std::make_unique<TrimResourcesStrategy>();
    case ContextStrategyKind::PassThrough:
      return std::make_unique<PassThroughStrategy>();
  }
  return std::make_unique<TrimResourcesStrategy>();
}

void sort_resources_by_importance(std::vector<ResourceItem>& items) {
  std::stable_sort(items.begin(), items.end(), [](const ResourceItem& a, const ResourceItem& b) {
    if (std::abs(a.priority - b.priority) >= kPriorityEpsilon) {
      return a.priority > b.priority;
    }
    return a.timestamp > b.timestamp;
  });
}

std::vector<Message> render_status_messages(const std::vector<ResourceItem>& items) {
  std::ostringstream status;
  for (const auto& item : items) {
    status << item.name << "\n```\n" << item.content << "\n```\n";
  }

  Message request = Message::assistant();
  request.add_tool_request(kStatusRequestId, ToolCallResult::success(ToolCall{"status", json::object()}));

  Message response = Message::user();
  response.add_tool_response(kStatusRequestId, ToolOutput::success({text_content(status.str())}));

  return {request, response};
}

Result<std::vector<Message>> truncate_for_recovery(const std::vector<Message>& history, double estimate_factor,
                                                   size_t context_limit, const std::string& system_prompt,
                                                   const std::vector<Tool>& tools, const TokenCounter& counter) {
  auto target = static_cast<size_t>(static_cast<double>(context_limit) * estimate_factor);
  auto overhead = counter.count_tokens(system_prompt) + counter.count_tools(tools);
  if (overhead > target) {
    return Result<std::vector<Message>>::failure("System prompt and tools exceed estimated context limit");
  }
  auto remaining = target - overhead;

  auto approx_count = counter.count_messages(history);
  if (approx_count <= remaining) {
    // The provider rejected a history within our estimate, so the oldest interaction goes anyway
    return drop_oldest_interaction(history, counter);
  }

  return fit_history(history, approx_count, remaining, counter);
}

}  // namespace converse
