#include "agent/agent.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>

#include "session/session_log.hpp"

namespace converse {

const char* const kDefaultFrontendInstructions =
    "The following tools are provided directly by the frontend and will be executed by the frontend when called.";

std::shared_ptr<Agent> Agent::create(std::shared_ptr<Provider> provider, std::shared_ptr<ExtensionManager> extensions,
                                     EngineConfig config) {
  if (!provider) {
    throw std::invalid_argument("Agent requires a provider");
  }
  if (!extensions) {
    throw std::invalid_argument("Agent requires an extension manager");
  }
  return std::shared_ptr<Agent>(new Agent(std::move(provider), std::move(extensions), std::move(config)));
}

Agent::Agent(std::shared_ptr<Provider> provider, std::shared_ptr<ExtensionManager> extensions, EngineConfig config)
    : provider_(std::move(provider)),
      extensions_(std::move(extensions)),
      config_(std::move(config)),
      token_counter_(std::make_shared<ApproxTokenCounter>()),
      tool_interpreter_(std::make_shared<JsonToolInterpreter>()),
      session_dir_(SessionLog::default_dir()),
      confirmations_(config_.channel_capacity),
      tool_results_(config_.channel_capacity) {
  spdlog::debug("[Agent] Created with provider {} (mode={}, context={})", provider_->name(), to_string(config_.mode),
                to_string(config_.context_strategy));
}

Agent::~Agent() {
  confirmations_.close();
  tool_results_.close();
}

void Agent::add_frontend_tools(const std::vector<Tool>& tools, std::optional<std::string> instructions) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& tool : tools) {
    frontend_tools_[tool.name] = tool;
  }
  frontend_instructions_ = instructions ? std::move(instructions) : std::optional<std::string>(kDefaultFrontendInstructions);
}

bool Agent::is_frontend_tool(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return frontend_tools_.count(name) > 0;
}

std::vector<Tool> Agent::list_tools() {
  if (!acquire_extensions(nullptr)) {
    return {};
  }
  std::unique_ptr<Agent, void (*)(Agent*)> held(this, [](Agent* self) { self->release_extensions(); });
  auto tools = extensions_->get_prefixed_tools();
  held.reset();

  if (!tools.ok()) {
    spdlog::warn("[Agent] Failed to list tools: {}", tools.error.value_or(""));
    return {};
  }
  return *tools.value;
}

void Agent::extend_system_prompt(const std::string& instruction) {
  std::lock_guard<std::mutex> lock(mutex_);
  prompt_manager_.add_system_prompt_extra(instruction);
}

void Agent::override_system_prompt(const std::string& tmpl) {
  std::lock_guard<std::mutex> lock(mutex_);
  prompt_manager_.set_system_prompt_override(tmpl);
}

void Agent::set_token_counter(std::shared_ptr<TokenCounter> counter) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (counter) token_counter_ = std::move(counter);
}

void Agent::set_tool_interpreter(std::shared_ptr<ToolInterpreter> interpreter) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (interpreter) tool_interpreter_ = std::move(interpreter);
}

void Agent::set_session_dir(std::filesystem::path dir) {
  std::lock_guard<std::mutex> lock(mutex_);
  session_dir_ = std::move(dir);
}

std::filesystem::path Agent::session_dir() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_dir_;
}

bool Agent::handle_confirmation(const RequestId& id, PermissionConfirmation confirmation) {
  spdlog::debug("[Agent] Confirmation for {}: {}", id, to_string(confirmation.permission));
  return confirmations_.send(id, confirmation);
}

bool Agent::handle_tool_result(const RequestId& id, ToolOutput result) {
  spdlog::debug("[Agent] Frontend result for {}", id);
  return tool_results_.send(id, std::move(result));
}

ReplyStream Agent::reply(std::vector<Message> messages, std::optional<SessionConfig> session) {
  return ReplyStream::start(shared_from_this(), std::move(messages), std::move(session));
}

Agent::Snapshot Agent::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return Snapshot{prompt_manager_, frontend_tools_, frontend_instructions_, token_counter_, tool_interpreter_};
}

bool Agent::acquire_extensions(const std::shared_ptr<std::atomic<bool>>& abort) {
  std::unique_lock<std::mutex> lock(gate_mutex_);
  while (extensions_busy_) {
    if (abort && abort->load()) {
      return false;
    }
    gate_cv_.wait_for(lock, std::chrono::milliseconds(20));
  }
  extensions_busy_ = true;
  return true;
}

void Agent::release_extensions() {
  {
    std::lock_guard<std::mutex> lock(gate_mutex_);
    extensions_busy_ = false;
  }
  gate_cv_.notify_one();
}

}  // namespace converse
