#pragma once

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "agent/agent_error.hpp"
#include "agent/prompt_manager.hpp"
#include "agent/reply_stream.hpp"
#include "context/token_counter.hpp"
#include "core/config.hpp"
#include "core/message.hpp"
#include "extension/extension_manager.hpp"
#include "llm/provider.hpp"
#include "llm/toolshim.hpp"
#include "permission/permission.hpp"
#include "permission/response_router.hpp"
#include "tool/tool.hpp"

namespace converse {

// Default frontend section of the system prompt
extern const char* const kDefaultFrontendInstructions;

// Drives conversations between a provider and the tools of an extension manager
class Agent : public std::enable_shared_from_this<Agent> {
 public:
  static std::shared_ptr<Agent> create(std::shared_ptr<Provider> provider, std::shared_ptr<ExtensionManager> extensions,
                                       EngineConfig config = EngineConfig{});

  ~Agent();

  Agent(const Agent&) = delete;
  Agent& operator=(const Agent&) = delete;

  // Tools executed by the caller; requests for them are yielded as FrontendToolRequest
  void add_frontend_tools(const std::vector<Tool>& tools, std::optional<std::string> instructions = std::nullopt);
  bool is_frontend_tool(const std::string& name) const;

  // Prefixed extension tools; waits for any active reply to release the extensions
  std::vector<Tool> list_tools();

  void extend_system_prompt(const std::string& instruction);
  void override_system_prompt(const std::string& tmpl);

  void set_token_counter(std::shared_ptr<TokenCounter> counter);
  void set_tool_interpreter(std::shared_ptr<ToolInterpreter> interpreter);

  // Where session logs live for the per-turn metrics hook
  void set_session_dir(std::filesystem::path dir);
  std::filesystem::path session_dir() const;

  // Decision for a yielded ToolConfirmationRequest; blocks while the channel is full
  bool handle_confirmation(const RequestId& id, PermissionConfirmation confirmation);

  // Result for a yielded FrontendToolRequest; blocks while the channel is full
  bool handle_tool_result(const RequestId& id, ToolOutput result);

  // Nothing runs until the stream is pulled
  ReplyStream reply(std::vector<Message> messages, std::optional<SessionConfig> session = std::nullopt);

  const EngineConfig& config() const {
    return config_;
  }

  Provider& provider() {
    return *provider_;
  }

  ExtensionManager& extensions() {
    return *extensions_;
  }

  PermissionStore& permission_store() {
    return permission_store_;
  }

 private:
  friend class detail::ReplyLoop;

  Agent(std::shared_ptr<Provider> provider, std::shared_ptr<ExtensionManager> extensions, EngineConfig config);

  // Settings captured when a reply starts
  struct Snapshot {
    PromptManager prompt_manager;
    std::map<std::string, Tool> frontend_tools;
    std::optional<std::string> frontend_instructions;
    std::shared_ptr<TokenCounter> token_counter;
    std::shared_ptr<ToolInterpreter> tool_interpreter;
  };

  Snapshot snapshot() const;

  // Exclusive use of the extension manager for the length of one reply
  bool acquire_extensions(const std::shared_ptr<std::atomic<bool>>& abort);
  void release_extensions();

  std::shared_ptr<Provider> provider_;
  std::shared_ptr<ExtensionManager> extensions_;
  EngineConfig config_;

  mutable std::mutex mutex_;
  PromptManager prompt_manager_;
  std::map<std::string, Tool> frontend_tools_;
  std::optional<std::string> frontend_instructions_;
  std::shared_ptr<TokenCounter> token_counter_;
  std::shared_ptr<ToolInterpreter> tool_interpreter_;
  std::filesystem::path session_dir_;

  PermissionStore permission_store_;
  ResponseRouter<PermissionConfirmation> confirmations_;
  ResponseRouter<ToolOutput> tool_results_;

  std::mutex gate_mutex_;
  std::condition_variable gate_cv_;
  bool extensions_busy_ = false;
};

}  // namespace converse
