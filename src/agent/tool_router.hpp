#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/message.hpp"
#include "extension/extension_manager.hpp"

namespace converse {

// Content returned instead of running a tool in chat mode
extern const char* const kChatModeSkipText;

// Content returned for a tool the user declined
extern const char* const kToolDeclinedText;

// Tool requests of one assistant message, by handling policy. Order within each group is kept.
struct ToolRequestCategories {
  std::vector<ToolRequestPart> frontend;
  std::vector<ToolRequestPart> enable_extension;
  std::vector<ToolRequestPart> search_extension;
  std::vector<ToolRequestPart> standard;  // includes requests whose tool call failed to parse

  // The response with its tool requests removed
  Message filtered;

  size_t total() const {
    return frontend.size() + enable_extension.size() + search_extension.size() + standard.size();
  }
};

ToolRequestCategories categorize_tool_requests(const Message& response,
                                               const std::function<bool(const std::string&)>& is_frontend_tool);

// A dispatched tool call
struct PendingToolCall {
  RequestId id;
  ToolCall call;
  std::future<ToolOutput> future;
};

/**
 * Start one tool call.
 *
 * Resource and extension-search platform tools go to the extension manager's
 * resource API; a frontend tool fails fast since only the frontend can run it.
 */
PendingToolCall create_tool_future(ExtensionManager& extensions, const RequestId& id, const ToolCall& call,
                                   bool is_frontend_tool);

// Waits for a future, polling the abort flag. False when aborted.
template <typename T>
bool wait_or_abort(std::future<T>& future, const std::shared_ptr<std::atomic<bool>>& abort,
                   std::chrono::milliseconds poll = std::chrono::milliseconds(10)) {
  while (future.wait_for(poll) != std::future_status::ready) {
    if (abort && abort->load()) {
      return false;
    }
  }
  return true;
}

// Result of a finished call, logged with its input. Exceptions become ExecutionError.
ToolOutput collect_tool_result(PendingToolCall& pending);

/**
 * Run every request concurrently and gather the results.
 *
 * All calls start before any is joined; the map is keyed by request id. Returns
 * an empty map if aborted, discarding any results still in flight.
 */
std::map<RequestId, ToolOutput> dispatch_concurrently(ExtensionManager& extensions,
                                                      const std::vector<ToolRequestPart>& requests,
                                                      const std::function<bool(const std::string&)>& is_frontend_tool,
                                                      const std::shared_ptr<std::atomic<bool>>& abort);

// User message answering the given ids in order; ids without a result are skipped
Message build_tool_response_message(const std::vector<RequestId>& order, const std::map<RequestId, ToolOutput>& results);

}  // namespace converse
