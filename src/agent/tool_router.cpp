#include "agent/tool_router.hpp"

#include <spdlog/spdlog.h>

#include "tool/platform_tools.hpp"

namespace converse {

const char* const kChatModeSkipText =
    "Let the user know the tool call was skipped in chat mode. "
    "DO NOT apologize for skipping the tool call. DO NOT say sorry. "
    "Provide an explanation of what the tool call would do, structured as a "
    "plan for the user. Again, DO NOT apologize. "
    "**Example Plan:**\n "
    "1. **Identify Task Scope** - Determine the purpose and expected outcome.\n "
    "2. **Outline Steps** - Break down the steps.\n "
    "If needed, adjust the explanation based on user preferences or questions.";

const char* const kToolDeclinedText =
    "The user has declined to run this tool. "
    "DO NOT attempt to call this tool again. "
    "If there are no alternative methods to proceed, clearly explain the situation and STOP.";

namespace {

std::future<ToolOutput> ready(ToolOutput output) {
  std::promise<ToolOutput> promise;
  promise.set_value(std::move(output));
  return promise.get_future();
}

}  // namespace

ToolRequestCategories categorize_tool_requests(const Message& response,
                                               const std::function<bool(const std::string&)>& is_frontend_tool) {
  ToolRequestCategories categories;
  categories.filtered = response.without_tool_requests();

  for (const auto* request : response.tool_requests()) {
    if (!request->tool_call.ok()) {
      categories.standard.push_back(*request);
      continue;
    }

    const auto& name = request->tool_call.value->name;
    if (is_frontend_tool && is_frontend_tool(name)) {
      categories.frontend.push_back(*request);
    } else if (name == platform_tools::kEnableExtension) {
      categories.enable_extension.push_back(*request);
    } else if (name == platform_tools::kSearchAvailableExtensions) {
      categories.search_extension.push_back(*request);
    } else {
      categories.standard.push_back(*request);
    }
  }

  return categories;
}

PendingToolCall create_tool_future(ExtensionManager& extensions, const RequestId& id, const ToolCall& call,
                                   bool is_frontend_tool) {
  PendingToolCall pending{id, call, {}};

  if (call.name == platform_tools::kReadResource) {
    pending.future = extensions.read_resource(call.arguments);
  } else if (call.name == platform_tools::kListResources) {
    pending.future = extensions.list_resources(call.arguments);
  } else if (call.name == platform_tools::kSearchAvailableExtensions) {
    pending.future = extensions.search_available_extensions();
  } else if (is_frontend_tool) {
    pending.future = ready(ToolOutput::failure(ToolError::execution("Frontend tool execution required")));
  } else {
    pending.future = extensions.dispatch_tool_call(call);
  }

  return pending;
}

ToolOutput collect_tool_result(PendingToolCall& pending) {
  ToolOutput output;
  try {
    output = pending.future.get();
  } catch (const std::exception& e) {
    output = ToolOutput::failure(ToolError::execution(e.what()));
  }

  spdlog::debug("[ToolRouter] input={} output={}", pending.call.to_json().dump(), tool_output_to_json(output).dump());
  return output;
}

std::map<RequestId, ToolOutput> dispatch_concurrently(ExtensionManager& extensions,
                                                      const std::vector<ToolRequestPart>& requests,
                                                      const std::function<bool(const std::string&)>& is_frontend_tool,
                                                      const std::shared_ptr<std::atomic<bool>>& abort) {
  std::vector<PendingToolCall> pending;
  std::map<RequestId, ToolOutput> results;

  for (const auto& request : requests) {
    if (!request.tool_call.ok()) {
      results.emplace(request.id, ToolOutput::failure(request.tool_call.error.value_or(ToolError{})));
      continue;
    }
    const auto& call = *request.tool_call.value;
    pending.push_back(create_tool_future(extensions, request.id, call, is_frontend_tool && is_frontend_tool(call.name)));
  }

  for (auto& p : pending) {
    if (!wait_or_abort(p.future, abort)) {
      spdlog::debug("[ToolRouter] Aborted with {} tool call(s) in flight", pending.size());
      return {};
    }
    results.insert_or_assign(p.id, collect_tool_result(p));
  }

  return results;
}

Message build_tool_response_message(const std::vector<RequestId>& order, const std::map<RequestId, ToolOutput>& results) {
  Message message = Message::user();
  for (const auto& id : order) {
    auto it = results.find(id);
    if (it != results.end()) {
      message.add_tool_response(id, it->second);
    }
  }
  return message;
}

}  // namespace converse
