#pragma once

#include <memory>
#include <string>
#include <vector>

#include "context/token_counter.hpp"
#include "core/config.hpp"
#include "core/message.hpp"
#include "extension/extension.hpp"
#include "tool/tool.hpp"

namespace converse {

// Request id of the synthetic status tool exchange
constexpr const char* kStatusRequestId = "000";

// Output of a context strategy for one provider call
struct PreparedContext {
  // History to keep; rebuilt when truncated
  std::vector<Message> history;

  // History plus any status context, sent to the provider only
  std::vector<Message> provider_messages;

  bool truncated = false;
};

struct ContextInput {
  const std::vector<Message>& history;
  const std::string& system_prompt;
  const std::vector<Tool>& tools;
  std::vector<ResourceItem> resources;
  size_t target_limit;
};

// Keeps a provider request inside the model's context budget
class ContextStrategy {
 public:
  virtual ~ContextStrategy() = default;

  virtual std::string name() const = 0;

  // Returns the input unchanged when it already fits; fails when nothing fits
  virtual Result<PreparedContext> prepare(ContextInput input, const TokenCounter& counter) const = 0;

  // Whether resources should be collected for prepare()
  virtual bool uses_resources() const {
    return false;
  }
};

// Sends history as is; overflow is left to ContextLengthExceeded recovery
class PassThroughStrategy : public ContextStrategy {
 public:
  std::string name() const override {
    return "pass_through";
  }

  Result<PreparedContext> prepare(ContextInput input, const TokenCounter& counter) const override;
};

// Drops whole interactions, oldest first
class DropOldestInteractionsStrategy : public ContextStrategy {
 public:
  std::string name() const override {
    return "drop_oldest";
  }

  Result<PreparedContext> prepare(ContextInput input, const TokenCounter& counter) const override;
};

// Adds resources as status context, dropping the least important ones first,
// then falls back to dropping interactions
class TrimResourcesStrategy : public ContextStrategy {
 public:
  std::string name() const override {
    return "trim_resources";
  }

  Result<PreparedContext> prepare(ContextInput input, const TokenCounter& counter) const override;

  bool uses_resources() const override {
    return true;
  }
};

std::unique_ptr<ContextStrategy> make_context_strategy(ContextStrategyKind kind);

// Sort by priority (high first), then timestamp (newest first)
void sort_resources_by_importance(std::vector<ResourceItem>& items);

/**
 * Synthetic assistant tool request plus user tool response carrying the
 * resource contents, so the model reads them as prior tool output.
 */
std::vector<Message> render_status_messages(const std::vector<ResourceItem>& items);

/**
 * Shrink history after the provider reported an overflow.
 *
 * The budget is context_limit * estimate_factor minus the system prompt and
 * tool definitions. A history already within that budget still loses its
 * oldest interaction, so every retry sends less than the rejected request.
 * Fails when only the newest interaction is left.
 */
Result<std::vector<Message>> truncate_for_recovery(const std::vector<Message>& history, double estimate_factor,
                                                   size_t context_limit, const std::string& system_prompt,
                                                   const std::vector<Tool>& tools, const TokenCounter& counter);

}  // namespace converse
