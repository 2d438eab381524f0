#include "agent/reply_stream.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <deque>
#include <map>
#include <set>
#include <thread>

#include "agent/agent.hpp"
#include "agent/tool_router.hpp"
#include "bus/bus.hpp"
#include "context/context_strategy.hpp"
#include "session/session_log.hpp"
#include "tool/platform_tools.hpp"

namespace converse {

namespace {

constexpr const char* kConfirmationPrompt = "The agent would like to call the above tool. Allow? (y/n):";

Message assistant_text(const std::string& text) {
  return Message::assistant(text);
}

}  // namespace

std::string to_string(ReplyState state) {
  switch (state) {
    case ReplyState::Preparing:
      return "preparing";
    case ReplyState::AwaitingProvider:
      return "awaiting_provider";
    case ReplyState::AwaitingFrontend:
      return "awaiting_frontend";
    case ReplyState::AwaitingApproval:
      return "awaiting_approval";
    case ReplyState::AwaitingTools:
      return "awaiting_tools";
    case ReplyState::Done:
      return "done";
    case ReplyState::Failed:
      return "failed";
  }
  return "unknown";
}

namespace detail {

class ReplyLoop {
 public:
  ReplyLoop(std::shared_ptr<Agent> agent, std::vector<Message> messages, std::optional<SessionConfig> session)
      : agent_(std::move(agent)), messages_(std::move(messages)), session_(std::move(session)) {}

  ~ReplyLoop() {
    abandon();
  }

  std::optional<Message> next();

  void cancel() {
    abort_->store(true);
    if (provider_pending_.load()) {
      agent_->provider().cancel();
    }
  }

  bool finished() const {
    return ended_ && outbox_.empty();
  }

  ReplyState state() const {
    return state_;
  }

 private:
  std::string session_id() const {
    return session_ ? session_->id : std::string();
  }

  const ModelConfig& model() const {
    return agent_->provider().model_config();
  }

  void step();
  void prepare();
  void refresh_catalog();
  void start_turn();
  void await_provider();
  void handle_provider_error(const ProviderError& error);
  void record_usage(const LlmResponse& response);
  void plan_tools(ToolRequestCategories& categories);
  void launch(const ToolRequestPart& request);
  void enable_extension(const ToolRequestPart& request);
  void await_frontend();
  void await_approval();
  void await_tools();
  void finish_turn();
  void end(bool success);
  void abandon();

  ReplyState next_wait_state() const {
    if (!frontend_queue_.empty()) return ReplyState::AwaitingFrontend;
    if (!approval_queue_.empty()) return ReplyState::AwaitingApproval;
    return ReplyState::AwaitingTools;
  }

  std::shared_ptr<Agent> agent_;
  std::vector<Message> messages_;
  std::optional<SessionConfig> session_;

  std::shared_ptr<std::atomic<bool>> abort_ = std::make_shared<std::atomic<bool>>(false);
  std::atomic<bool> provider_pending_{false};
  ReplyState state_ = ReplyState::Preparing;
  std::deque<Message> outbox_;
  bool holds_extensions_ = false;
  bool started_ = false;
  bool ended_ = false;

  // Fixed for the reply, except the catalog which is rebuilt after enable_extension
  Agent::Snapshot settings_;
  std::unique_ptr<ContextStrategy> strategy_;
  std::function<bool(const std::string&)> is_frontend_;
  std::string system_prompt_;
  std::vector<Tool> tools_;
  std::vector<Tool> toolshim_tools_;
  std::set<std::string> read_only_tools_;
  int truncation_attempt_ = 0;
  size_t turns_ = 0;

  // Current turn
  std::optional<std::future<LlmResponse>> provider_future_;
  Message response_;
  std::vector<RequestId> request_order_;
  std::map<RequestId, ToolOutput> results_;
  std::deque<ToolRequestPart> frontend_queue_;
  std::deque<ToolRequestPart> approval_queue_;
  bool request_announced_ = false;
  std::vector<PendingToolCall> inflight_;
  bool extensions_changed_ = false;
};

std::optional<Message> ReplyLoop::next() {
  try {
    while (true) {
      if (abort_->load()) {
        if (!ended_) spdlog::info("[Reply] Cancelled in state {}", to_string(state_));
        abandon();
        return std::nullopt;
      }
      if (!outbox_.empty()) {
        Message message = std::move(outbox_.front());
        outbox_.pop_front();
        return message;
      }
      if (state_ == ReplyState::Done || state_ == ReplyState::Failed) {
        end(state_ == ReplyState::Done);
        return std::nullopt;
      }
      step();
    }
  } catch (const std::exception& e) {
    spdlog::error("[Reply] Failed in state {}: {}", to_string(state_), e.what());
    state_ = ReplyState::Failed;
    outbox_.clear();
    end(false);
    throw;
  }
}

void ReplyLoop::step() {
  switch (state_) {
    case ReplyState::Preparing:
      prepare();
      break;
    case ReplyState::AwaitingProvider:
      if (provider_future_) {
        await_provider();
      } else {
        start_turn();
      }
      break;
    case ReplyState::AwaitingFrontend:
      await_frontend();
      break;
    case ReplyState::AwaitingApproval:
      await_approval();
      break;
    case ReplyState::AwaitingTools:
      await_tools();
      break;
    case ReplyState::Done:
    case ReplyState::Failed:
      break;
  }
}

void ReplyLoop::prepare() {
  if (!agent_->acquire_extensions(abort_)) {
    state_ = ReplyState::Done;
    return;
  }
  holds_extensions_ = true;

  settings_ = agent_->snapshot();
  auto frontend_tools = settings_.frontend_tools;
  is_frontend_ = [frontend_tools](const std::string& name) { return frontend_tools.count(name) > 0; };
  strategy_ = make_context_strategy(agent_->config().context_strategy);

  refresh_catalog();

  Bus::instance().publish(events::ReplyStarted{session_id(), messages_.size()});
  started_ = true;
  if (!messages_.empty()) {
    spdlog::debug("[Reply] User message: {}", messages_.back().as_concat_text());
  }
  spdlog::info("[Reply] Starting with {} messages, {} tools, context strategy {}", messages_.size(), tools_.size(),
               strategy_->name());

  state_ = ReplyState::AwaitingProvider;
}

void ReplyLoop::refresh_catalog() {
  auto& extensions = agent_->extensions();

  auto prefixed = extensions.get_prefixed_tools();
  if (!prefixed.ok()) {
    throw AgentError(AgentError::Kind::Extension, "Failed to list tools: " + prefixed.error.value_or(""));
  }

  tools_ = std::move(*prefixed.value);
  if (extensions.supports_resources()) {
    tools_.push_back(platform_tools::read_resource_tool());
    tools_.push_back(platform_tools::list_resources_tool());
  }
  tools_.push_back(platform_tools::search_available_extensions_tool());
  tools_.push_back(platform_tools::enable_extension_tool());
  for (const auto& [name, tool] : settings_.frontend_tools) {
    tools_.push_back(tool);
  }

  read_only_tools_.clear();
  for (const auto& tool : tools_) {
    if (tool.is_read_only()) read_only_tools_.insert(tool.name);
  }

  system_prompt_ =
      settings_.prompt_manager.build_system_prompt(extensions.get_extensions_info(), settings_.frontend_instructions);

  // Toolshim models see the tools only through the prompt
  toolshim_tools_.clear();
  if (model().toolshim) {
    system_prompt_ = modify_system_prompt_for_tool_json(system_prompt_, tools_);
    toolshim_tools_ = std::move(tools_);
    tools_.clear();
  }
}

void ReplyLoop::start_turn() {
  const auto& config = agent_->config();
  if (turns_ >= static_cast<size_t>(config.max_turns)) {
    spdlog::warn("[Reply] Reached max turns ({})", config.max_turns);
    outbox_.push_back(assistant_text("Error: Reached the limit of " + std::to_string(config.max_turns) +
                                     " model calls in one reply."));
    state_ = ReplyState::Done;
    return;
  }
  ++turns_;

  std::vector<ResourceItem> resources;
  auto& extensions = agent_->extensions();
  if (strategy_->uses_resources() && extensions.supports_resources()) {
    auto items = extensions.get_resources();
    if (items.ok()) {
      resources = std::move(*items.value);
    } else {
      spdlog::warn("[Reply] Failed to collect resources: {}", items.error.value_or(""));
    }
  }

  auto prepared = strategy_->prepare(
      ContextInput{messages_, system_prompt_, tools_, std::move(resources), model().estimated_limit()},
      *settings_.token_counter);
  if (!prepared.ok()) {
    throw AgentError(AgentError::Kind::ContextLimit, prepared.error.value_or("Context exceeds the model limit"));
  }

  if (prepared.value->truncated) {
    spdlog::info("[Reply] Context truncated from {} to {} messages", messages_.size(),
                 prepared.value->history.size());
    Bus::instance().publish(
        events::ContextTruncated{session_id(), messages_.size(), prepared.value->history.size(), 0});
    messages_ = prepared.value->history;
  }

  LlmRequest request{system_prompt_, std::move(prepared.value->provider_messages), tools_};
  spdlog::debug("[Reply] Turn {}: sending {} messages to {}", turns_, request.messages.size(),
                agent_->provider().name());
  provider_pending_.store(true);
  provider_future_ = agent_->provider().complete(request);
}

void ReplyLoop::await_provider() {
  bool ready = wait_or_abort(*provider_future_, abort_);
  provider_pending_.store(false);
  if (!ready || abort_->load()) {
    // A response racing with cancel() is dropped too
    if (!ready) agent_->provider().cancel();
    provider_future_.reset();
    return;
  }

  LlmResponse response;
  try {
    response = provider_future_->get();
  } catch (const std::exception& e) {
    response = LlmResponse::failure(ProviderError{ProviderError::Kind::RequestFailed, e.what()});
  }
  provider_future_.reset();

  if (!response.ok()) {
    handle_provider_error(*response.error);
    return;
  }

  if (model().toolshim) {
    auto augmented = augment_message_with_tool_calls(*settings_.tool_interpreter, response.message, toolshim_tools_);
    if (!augmented.ok()) {
      handle_provider_error(ProviderError::execution("Failed to augment message: " + augmented.error.value_or("")));
      return;
    }
    response.message = std::move(*augmented.value);
  }

  record_usage(response);
  truncation_attempt_ = 0;
  response_ = std::move(response.message);

  auto categories = categorize_tool_requests(response_, is_frontend_);
  outbox_.push_back(categories.filtered);

  if (categories.total() == 0) {
    state_ = ReplyState::Done;
    return;
  }
  plan_tools(categories);
}

void ReplyLoop::handle_provider_error(const ProviderError& error) {
  const auto& config = agent_->config();

  if (error.kind != ProviderError::Kind::ContextLengthExceeded) {
    spdlog::error("[Reply] Provider error: {}", error.to_string());
    outbox_.push_back(assistant_text("Ran into this error: " + error.to_string() +
                                     ".\n\nPlease retry if you think this is a transient or recoverable error."));
    state_ = ReplyState::Done;
    return;
  }

  if (truncation_attempt_ >= config.max_truncation_attempts) {
    spdlog::error("[Reply] Context still too long after {} truncation attempts", truncation_attempt_);
    outbox_.push_back(assistant_text(
        "Error: Context length exceeds limits even after multiple attempts to truncate. Please start a new session "
        "with fresh context and try again."));
    state_ = ReplyState::Done;
    return;
  }

  ++truncation_attempt_;
  double factor = std::pow(config.estimate_factor_decay, truncation_attempt_);
  spdlog::warn("[Reply] Context length exceeded, truncating (attempt {}/{}, factor {:.3f})", truncation_attempt_,
               config.max_truncation_attempts, factor);

  const auto& catalog = model().toolshim ? toolshim_tools_ : tools_;
  auto truncated = truncate_for_recovery(messages_, factor, model().estimated_limit(), system_prompt_, catalog,
                                         *settings_.token_counter);
  if (!truncated.ok()) {
    spdlog::error("[Reply] Truncation failed: {}", truncated.error.value_or(""));
    outbox_.push_back(assistant_text(
        "Error: Unable to truncate messages to stay within context limit. \n\nRan into this error: " +
        truncated.error.value_or("") + ".\n\nPlease start a new session with fresh context and try again."));
    state_ = ReplyState::Done;
    return;
  }

  Bus::instance().publish(
      events::ContextTruncated{session_id(), messages_.size(), truncated.value->size(), truncation_attempt_});
  messages_ = std::move(*truncated.value);

  std::this_thread::yield();
  state_ = ReplyState::AwaitingProvider;
}

void ReplyLoop::record_usage(const LlmResponse& response) {
  Bus::instance().publish(
      events::TokensUsed{session_id(), response.usage.input_tokens, response.usage.output_tokens});

  if (!session_) return;

  SessionLog log(SessionLog::path_for(agent_->session_dir(), session_->id));
  SessionMetadata metadata = log.read_metadata();
  metadata.working_dir = session_->working_dir;
  metadata.total_tokens = response.usage.total();
  metadata.input_tokens = response.usage.input_tokens;
  metadata.output_tokens = response.usage.output_tokens;
  // The response is not in history yet
  metadata.message_count = messages_.size() + 1;
  if (!log.update_metadata(metadata)) {
    spdlog::warn("[Reply] Failed to update session metrics for {}", session_->id);
  }
}

void ReplyLoop::plan_tools(ToolRequestCategories& categories) {
  request_order_.clear();
  results_.clear();
  for (const auto* request : response_.tool_requests()) {
    request_order_.push_back(request->id);
  }

  const ExecutionMode mode = agent_->config().mode;

  for (const auto& request : categories.search_extension) {
    launch(request);
  }

  std::vector<ToolRequestPart> standard;
  for (auto& request : categories.standard) {
    if (!request.tool_call.ok()) {
      results_.insert_or_assign(request.id, ToolOutput::failure(request.tool_call.error.value_or(ToolError{})));
    } else {
      standard.push_back(std::move(request));
    }
  }

  if (mode == ExecutionMode::Chat) {
    for (const auto& request : standard) {
      results_.insert_or_assign(request.id, ToolOutput::success({text_content(kChatModeSkipText)}));
    }
    for (const auto& request : categories.enable_extension) {
      results_.insert_or_assign(request.id, ToolOutput::success({text_content(kChatModeSkipText)}));
    }
  } else {
    for (const auto& request : categories.enable_extension) {
      if (mode == ExecutionMode::Auto) {
        enable_extension(request);
      } else {
        approval_queue_.push_back(request);
      }
    }

    auto permissions = check_tool_permissions(standard, mode, read_only_tools_, agent_->permission_store());
    for (const auto& request : permissions.approved) {
      launch(request);
    }
    for (const auto& request : permissions.denied) {
      results_.insert_or_assign(request.id, ToolOutput::success({text_content(kToolDeclinedText)}));
    }
    for (auto& request : permissions.needs_approval) {
      approval_queue_.push_back(std::move(request));
    }
  }

  for (auto& request : categories.frontend) {
    frontend_queue_.push_back(std::move(request));
  }

  request_announced_ = false;
  state_ = next_wait_state();
}

void ReplyLoop::launch(const ToolRequestPart& request) {
  const ToolCall& call = *request.tool_call.value;
  Bus::instance().publish(events::ToolCallStarted{session_id(), request.id, call.name});
  inflight_.push_back(create_tool_future(agent_->extensions(), request.id, call, is_frontend_(call.name)));
}

void ReplyLoop::enable_extension(const ToolRequestPart& request) {
  const ToolCall& call = *request.tool_call.value;
  std::string name = call.arguments.value("extension_name", "");

  auto enabled = agent_->extensions().enable_extension(name);
  if (enabled.ok()) {
    spdlog::info("[Reply] Enabled extension {}", name);
    results_.insert_or_assign(request.id, ToolOutput::success({text_content(*enabled.value)}));
    extensions_changed_ = true;
  } else {
    spdlog::warn("[Reply] Failed to enable extension {}: {}", name, enabled.error.value_or(""));
    results_.insert_or_assign(request.id, ToolOutput::failure(ToolError::execution(enabled.error.value_or(""))));
  }
}

void ReplyLoop::await_frontend() {
  const ToolRequestPart& request = frontend_queue_.front();
  if (!request.tool_call.ok()) {
    throw AgentError(AgentError::Kind::Invariant, "Frontend request " + request.id + " has no tool call");
  }
  const ToolCall& call = *request.tool_call.value;

  if (!request_announced_) {
    Message message = Message::assistant();
    message.add_frontend_tool_request(request.id, request.tool_call);
    outbox_.push_back(std::move(message));
    Bus::instance().publish(events::ToolCallStarted{session_id(), request.id, call.name});
    request_announced_ = true;
    return;
  }

  auto result = agent_->tool_results_.wait(request.id, abort_);
  if (!result) {
    if (abort_->load()) return;
    result = ToolOutput::failure(ToolError::execution("Frontend tool result channel closed"));
  }

  Bus::instance().publish(events::ToolCallCompleted{session_id(), request.id, call.name, result->ok()});
  results_.insert_or_assign(request.id, std::move(*result));
  frontend_queue_.pop_front();
  request_announced_ = false;
  state_ = next_wait_state();
}

void ReplyLoop::await_approval() {
  const ToolRequestPart& request = approval_queue_.front();
  if (!request.tool_call.ok()) {
    throw AgentError(AgentError::Kind::Invariant, "Approval request " + request.id + " has no tool call");
  }
  const ToolCall& call = *request.tool_call.value;

  if (!request_announced_) {
    Message message = Message::user();
    message.add_tool_confirmation_request(request.id, call.name, call.arguments, std::string(kConfirmationPrompt));
    outbox_.push_back(std::move(message));
    Bus::instance().publish(events::PermissionRequested{session_id(), request.id, call.name});
    request_announced_ = true;
    return;
  }

  auto decision = agent_->confirmations_.wait(request.id, abort_);
  if (!decision) {
    if (abort_->load()) return;
    decision = PermissionConfirmation{Permission::DenyOnce};
  }

  if (!decision->allowed()) {
    spdlog::info("[Reply] User declined {}", call.name);
    results_.insert_or_assign(request.id, ToolOutput::success({text_content(kToolDeclinedText)}));
  } else if (call.name == platform_tools::kEnableExtension) {
    enable_extension(request);
  } else {
    if (decision->permission == Permission::AlwaysAllow) {
      agent_->permission_store().set(call.name, PermissionLevel::AlwaysAllow);
    }
    launch(request);
  }

  approval_queue_.pop_front();
  request_announced_ = false;
  state_ = next_wait_state();
}

void ReplyLoop::await_tools() {
  for (auto& pending : inflight_) {
    if (!pending.future.valid()) continue;
    if (!wait_or_abort(pending.future, abort_)) return;

    ToolOutput output = collect_tool_result(pending);
    Bus::instance().publish(events::ToolCallCompleted{session_id(), pending.id, pending.call.name, output.ok()});
    results_.insert_or_assign(pending.id, std::move(output));
  }
  inflight_.clear();
  finish_turn();
}

void ReplyLoop::finish_turn() {
  if (extensions_changed_) {
    refresh_catalog();
    extensions_changed_ = false;
  }

  Message tool_response = build_tool_response_message(request_order_, results_);
  outbox_.push_back(tool_response);

  messages_.push_back(response_);
  messages_.push_back(std::move(tool_response));

  request_order_.clear();
  results_.clear();

  std::this_thread::yield();
  state_ = ReplyState::AwaitingProvider;
}

void ReplyLoop::end(bool success) {
  if (holds_extensions_) {
    agent_->release_extensions();
    holds_extensions_ = false;
  }
  if (ended_) return;
  ended_ = true;
  if (started_) {
    Bus::instance().publish(events::ReplyEnded{session_id(), turns_, success});
    spdlog::info("[Reply] Ended after {} turns ({})", turns_, success ? "ok" : "failed");
  }
}

void ReplyLoop::abandon() {
  abort_->store(true);
  if (provider_future_) {
    agent_->provider().cancel();
    provider_future_.reset();
    provider_pending_.store(false);
  }
  // An answer to the request yielded last may still arrive; nobody will wait for it
  if (request_announced_) {
    if (state_ == ReplyState::AwaitingFrontend && !frontend_queue_.empty()) {
      agent_->tool_results_.discard(frontend_queue_.front().id);
    } else if (state_ == ReplyState::AwaitingApproval && !approval_queue_.empty()) {
      agent_->confirmations_.discard(approval_queue_.front().id);
    }
    request_announced_ = false;
  }
  // Results of calls still running are dropped with their futures
  inflight_.clear();
  frontend_queue_.clear();
  approval_queue_.clear();
  outbox_.clear();
  if (state_ != ReplyState::Failed) state_ = ReplyState::Done;
  end(false);
}

}  // namespace detail

ReplyStream::ReplyStream(std::unique_ptr<detail::ReplyLoop> loop) : loop_(std::move(loop)) {}

ReplyStream::ReplyStream(ReplyStream&& other) noexcept = default;

ReplyStream& ReplyStream::operator=(ReplyStream&& other) noexcept = default;

ReplyStream::~ReplyStream() = default;

ReplyStream ReplyStream::start(std::shared_ptr<Agent> agent, std::vector<Message> messages,
                               std::optional<SessionConfig> session) {
  return ReplyStream(std::make_unique<detail::ReplyLoop>(std::move(agent), std::move(messages), std::move(session)));
}

std::optional<Message> ReplyStream::next() {
  if (!loop_) return std::nullopt;
  return loop_->next();
}

void ReplyStream::cancel() {
  if (loop_) loop_->cancel();
}

bool ReplyStream::finished() const {
  return !loop_ || loop_->finished();
}

ReplyState ReplyStream::state() const {
  return loop_ ? loop_->state() : ReplyState::Done;
}

std::vector<Message> ReplyStream::collect() {
  std::vector<Message> messages;
  while (auto message = next()) {
    messages.push_back(std::move(*message));
  }
  return messages;
}

}  // namespace converse
