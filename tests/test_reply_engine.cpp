#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "agent/agent.hpp"
#include "agent/tool_router.hpp"
#include "bus/bus.hpp"
#include "session/session_log.hpp"
#include "tool/platform_tools.hpp"
#include "test_util.hpp"

using namespace converse;
using namespace converse::test_util;

namespace fs = std::filesystem;

namespace {

// Replays queued responses and records every request
class ScriptedProvider : public Provider {
 public:
  using Step = std::function<LlmResponse(const LlmRequest&)>;

  explicit ScriptedProvider(size_t context_limit = 100000) : model_("mock-model") {
    model_.with_context_limit(context_limit);
  }

  std::string name() const override {
    return "scripted";
  }

  const ModelConfig& model_config() const override {
    return model_;
  }

  ModelConfig& mutable_model() {
    return model_;
  }

  std::future<LlmResponse> complete(const LlmRequest& request) override {
    Step step;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(request);
      if (!steps_.empty()) {
        step = std::move(steps_.front());
        steps_.pop_front();
      }
    }

    std::promise<LlmResponse> promise;
    promise.set_value(step ? step(request) : text_response("done"));
    return promise.get_future();
  }

  void cancel() override {
    ++cancels_;
  }

  void push(Step step) {
    std::lock_guard<std::mutex> lock(mutex_);
    steps_.push_back(std::move(step));
  }

  void push_text(const std::string& text) {
    push([text](const LlmRequest&) { return text_response(text); });
  }

  void push_message(const Message& message) {
    push([message](const LlmRequest&) {
      LlmResponse response;
      response.message = message;
      response.usage.input_tokens = 100;
      response.usage.output_tokens = 10;
      return response;
    });
  }

  void push_error(const ProviderError& error) {
    push([error](const LlmRequest&) { return LlmResponse::failure(error); });
  }

  size_t calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
  }

  LlmRequest request(size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.at(index);
  }

  int cancels() const {
    return cancels_.load();
  }

  static LlmResponse text_response(const std::string& text) {
    LlmResponse response;
    response.message = Message::assistant(text);
    response.usage.input_tokens = 100;
    response.usage.output_tokens = 10;
    return response;
  }

 private:
  ModelConfig model_;
  mutable std::mutex mutex_;
  std::deque<Step> steps_;
  std::vector<LlmRequest> requests_;
  std::atomic<int> cancels_{0};
};

// Never answers until cancelled
class HangingProvider : public Provider {
 public:
  HangingProvider() : model_("hanging-model") {}

  ~HangingProvider() override {
    cancel();
  }

  std::string name() const override {
    return "hanging";
  }

  const ModelConfig& model_config() const override {
    return model_;
  }

  std::future<LlmResponse> complete(const LlmRequest&) override {
    std::lock_guard<std::mutex> lock(mutex_);
    promise_ = std::make_unique<std::promise<LlmResponse>>();
    return promise_->get_future();
  }

  void cancel() override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++cancels_;
    if (promise_) {
      promise_->set_value(LlmResponse::failure(ProviderError{ProviderError::Kind::RequestFailed, "cancelled"}));
      promise_.reset();
    }
  }

  int cancels() const {
    return cancels_.load();
  }

 private:
  ModelConfig model_;
  std::mutex mutex_;
  std::unique_ptr<std::promise<LlmResponse>> promise_;
  std::atomic<int> cancels_{0};
};

class BrokenExtensionManager : public LocalExtensionManager {
 public:
  Result<std::vector<Tool>> get_prefixed_tools() override {
    return Result<std::vector<Tool>>::failure("transport down");
  }
};

std::shared_ptr<FunctionExtension> make_math(std::shared_ptr<std::atomic<int>> calls) {
  auto ext = std::make_shared<FunctionExtension>("math");
  auto add = Tool::with_parameters("add", "Add", {{"a", "number", "A"}, {"b", "number", "B"}});
  ext->add_tool(add, [calls](const json& args) {
    ++*calls;
    return ToolOutput::success({text_content(std::to_string(args["a"].get<int>() + args["b"].get<int>()))});
  });

  auto lookup = Tool::with_parameters("lookup", "Read-only lookup", {});
  lookup.annotations = ToolAnnotations{true, false};
  ext->add_tool(lookup, [](const json&) { return ToolOutput::success({text_content("found")}); });
  return ext;
}

EngineConfig config_with(ExecutionMode mode, ContextStrategyKind strategy = ContextStrategyKind::TrimResources) {
  EngineConfig config;
  config.mode = mode;
  config.context_strategy = strategy;
  return config;
}

bool has_tool(const std::vector<Tool>& tools, const std::string& name) {
  for (const auto& tool : tools) {
    if (tool.name == name) return true;
  }
  return false;
}

}  // namespace

class ReplyEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    provider_ = std::make_shared<ScriptedProvider>();
    extensions_ = std::make_shared<LocalExtensionManager>(4);
    tool_calls_ = std::make_shared<std::atomic<int>>(0);
    extensions_->add_extension(make_math(tool_calls_));
  }

  std::shared_ptr<Agent> make_agent(EngineConfig config = EngineConfig{}) {
    return Agent::create(provider_, extensions_, config);
  }

  std::shared_ptr<ScriptedProvider> provider_;
  std::shared_ptr<LocalExtensionManager> extensions_;
  std::shared_ptr<std::atomic<int>> tool_calls_;
};

TEST_F(ReplyEngineTest, PlainAnswerEndsStream) {
  auto agent = make_agent();
  provider_->push_text("Hello there");

  auto stream = agent->reply({Message::user("hi")});
  auto first = stream.next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->role(), Role::Assistant);
  EXPECT_EQ(first->text(), "Hello there");

  EXPECT_FALSE(stream.next().has_value());
  EXPECT_TRUE(stream.finished());
  EXPECT_EQ(stream.state(), ReplyState::Done);
  EXPECT_EQ(provider_->calls(), 1u);
}

TEST_F(ReplyEngineTest, NothingRunsUntilPulled) {
  auto agent = make_agent();
  {
    auto stream = agent->reply({Message::user("hi")});
    EXPECT_EQ(stream.state(), ReplyState::Preparing);
  }
  EXPECT_EQ(provider_->calls(), 0u);
}

TEST_F(ReplyEngineTest, CatalogIncludesPlatformTools) {
  auto agent = make_agent();
  provider_->push_text("ok");
  agent->reply({Message::user("hi")}).collect();

  auto request = provider_->request(0);
  EXPECT_TRUE(has_tool(request.tools, "math__add"));
  EXPECT_TRUE(has_tool(request.tools, platform_tools::kSearchAvailableExtensions));
  EXPECT_TRUE(has_tool(request.tools, platform_tools::kEnableExtension));
  // No extension has resources
  EXPECT_FALSE(has_tool(request.tools, platform_tools::kReadResource));
  EXPECT_NE(request.system_prompt.find("math"), std::string::npos);
}

TEST_F(ReplyEngineTest, ToolCallRoundTrip) {
  auto agent = make_agent();
  provider_->push_message(tool_request_message("call_1", "math__add", {{"a", 2}, {"b", 3}}, "Adding."));
  provider_->push_text("The sum is 5.");

  auto messages = agent->reply({Message::user("2+3?")}).collect();
  ASSERT_EQ(messages.size(), 3u);

  EXPECT_EQ(messages[0].text(), "Adding.");
  EXPECT_FALSE(messages[0].has_tool_request());

  auto responses = messages[1].tool_responses();
  ASSERT_EQ(responses.size(), 1u);
  EXPECT_EQ(responses[0]->id, "call_1");
  EXPECT_EQ(first_text(responses[0]->tool_result), "5");

  EXPECT_EQ(messages[2].text(), "The sum is 5.");
  EXPECT_EQ(tool_calls_->load(), 1);

  // The second request carries the full tool exchange
  ASSERT_EQ(provider_->calls(), 2u);
  auto second = provider_->request(1);
  ASSERT_GE(second.messages.size(), 3u);
  const auto& request_message = second.messages[second.messages.size() - 2];
  const auto& response_message = second.messages.back();
  ASSERT_EQ(request_message.tool_requests().size(), 1u);
  EXPECT_EQ(request_message.tool_requests()[0]->id, "call_1");
  ASSERT_EQ(response_message.tool_responses().size(), 1u);
}

TEST_F(ReplyEngineTest, ResponsesFollowRequestOrder) {
  auto agent = make_agent();
  Message response = Message::assistant();
  response.add_tool_request("r1", ToolCallResult::success(ToolCall{"math__add", {{"a", 1}, {"b", 1}}}));
  response.add_tool_request("r2", ToolCallResult::failure(ToolError::invalid_parameters("could not parse")));
  response.add_tool_request("r3", ToolCallResult::success(ToolCall{platform_tools::kSearchAvailableExtensions, {}}));
  response.add_tool_request("r4", ToolCallResult::success(ToolCall{"math__lookup", json::object()}));
  provider_->push_message(response);
  provider_->push_text("done");

  auto messages = agent->reply({Message::user("go")}).collect();
  ASSERT_EQ(messages.size(), 3u);

  auto responses = messages[1].tool_responses();
  ASSERT_EQ(responses.size(), 4u);
  EXPECT_EQ(responses[0]->id, "r1");
  EXPECT_EQ(responses[1]->id, "r2");
  EXPECT_EQ(responses[2]->id, "r3");
  EXPECT_EQ(responses[3]->id, "r4");

  ASSERT_FALSE(responses[1]->tool_result.ok());
  EXPECT_EQ(responses[1]->tool_result.error->message, "could not parse");
  EXPECT_NE(first_text(responses[2]->tool_result).find("Extensions available to enable"), std::string::npos);
}

TEST_F(ReplyEngineTest, ContextLengthExceededGivesUpAfterRetries) {
  auto agent = make_agent(config_with(ExecutionMode::Auto, ContextStrategyKind::PassThrough));
  for (int i = 0; i < 4; ++i) {
    provider_->push_error(ProviderError::context_length_exceeded("too long"));
  }

  std::vector<Message> history;
  for (int i = 0; i < 5; ++i) {
    history.push_back(Message::user("question " + std::to_string(i)));
    history.push_back(Message::assistant("answer " + std::to_string(i)));
  }
  history.push_back(Message::user("again"));

  auto messages = agent->reply(history).collect();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].role(), Role::Assistant);
  EXPECT_EQ(messages[0].text().rfind("Error: Context length exceeds limits even after multiple attempts to truncate.", 0),
            0u);
  EXPECT_EQ(provider_->calls(), 4u);

  // Each retry sends one interaction less than the request before it
  for (size_t i = 1; i < 4; ++i) {
    EXPECT_EQ(provider_->request(i).messages.size(), provider_->request(i - 1).messages.size() - 2) << "call " << i;
  }
}

TEST_F(ReplyEngineTest, DefaultStrategyRetriesWithShorterHistory) {
  auto agent = make_agent();
  provider_->mutable_model().with_context_limit(2000);

  std::vector<Message> history = {Message::user("hi"),   Message::assistant("hello"), Message::user("how are you"),
                                  Message::assistant("good"), Message::user("tell me more"),
                                  Message::assistant("sure"), Message::user("bye")};

  provider_->push_error(ProviderError::context_length_exceeded("too long"));
  provider_->push_error(ProviderError::context_length_exceeded("still too long"));
  provider_->push_text("goodbye");

  auto messages = agent->reply(history).collect();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].text(), "goodbye");

  ASSERT_EQ(provider_->calls(), 3u);
  EXPECT_EQ(provider_->request(0).messages.size(), 7u);
  EXPECT_LT(provider_->request(1).messages.size(), provider_->request(0).messages.size());
  EXPECT_LT(provider_->request(2).messages.size(), provider_->request(1).messages.size());
  EXPECT_EQ(provider_->request(2).messages.front().text(), "tell me more");
  EXPECT_EQ(provider_->request(2).messages.back().text(), "bye");
}

TEST_F(ReplyEngineTest, RecoveryFailsWhenNothingOlderIsLeft) {
  auto agent = make_agent();
  provider_->push_error(ProviderError::context_length_exceeded("too long"));

  auto messages = agent->reply({Message::user("hi"), Message::assistant("hello"), Message::user("again")}).collect();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].text().rfind("Error: Unable to truncate messages to stay within context limit.", 0), 0u);
  EXPECT_NE(messages[0].text().find("No older interactions left to drop"), std::string::npos);
  EXPECT_EQ(provider_->calls(), 1u);
}

TEST_F(ReplyEngineTest, ContextLengthExceededRecoversByTruncating) {
  auto agent = make_agent(config_with(ExecutionMode::Auto, ContextStrategyKind::PassThrough));
  provider_->mutable_model().with_context_limit(2000);

  std::vector<Message> history;
  for (int i = 0; i < 6; ++i) {
    history.push_back(Message::user("question " + std::to_string(i) + std::string(600, 'q')));
    history.push_back(Message::assistant("answer " + std::to_string(i) + std::string(600, 'a')));
  }
  history.push_back(Message::user("latest"));

  std::vector<events::ContextTruncated> truncations;
  auto sub = Bus::instance().subscribe<events::ContextTruncated>(
      [&truncations](const events::ContextTruncated& e) { truncations.push_back(e); });

  provider_->push_error(ProviderError::context_length_exceeded("too long"));
  provider_->push_text("short answer");

  auto messages = agent->reply(history).collect();
  Bus::instance().unsubscribe(sub);

  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].text(), "short answer");
  ASSERT_EQ(provider_->calls(), 2u);
  auto retried = provider_->request(1);
  EXPECT_LT(retried.messages.size(), history.size());
  EXPECT_EQ(retried.messages.back().text(), "latest");

  ASSERT_EQ(truncations.size(), 1u);
  EXPECT_EQ(truncations[0].attempt, 1);
  EXPECT_EQ(truncations[0].messages_before, history.size());
}

TEST_F(ReplyEngineTest, FatalProviderErrorEndsStream) {
  auto agent = make_agent();
  provider_->push_error(ProviderError{ProviderError::Kind::ServerError, "upstream 503"});

  auto messages = agent->reply({Message::user("hi")}).collect();
  ASSERT_EQ(messages.size(), 1u);
  ProviderError error{ProviderError::Kind::ServerError, "upstream 503"};
  std::string expected =
      "Ran into this error: " + error.to_string() + ".\n\nPlease retry if you think this is a transient or recoverable error.";
  EXPECT_EQ(messages[0].text(), expected);
  EXPECT_EQ(provider_->calls(), 1u);
}

TEST_F(ReplyEngineTest, FrontendToolRoundTrip) {
  auto agent = make_agent();
  agent->add_frontend_tools({Tool::with_parameters("pick_file", "Ask the user for a file", {})});
  EXPECT_TRUE(agent->is_frontend_tool("pick_file"));

  provider_->push_message(tool_request_message("fe_1", "pick_file"));
  provider_->push_text("You picked notes.txt");

  auto stream = agent->reply({Message::user("open a file")});
  auto filtered = stream.next();
  ASSERT_TRUE(filtered.has_value());
  EXPECT_FALSE(filtered->has_tool_request());

  auto request = stream.next();
  ASSERT_TRUE(request.has_value());
  ASSERT_EQ(request->parts().size(), 1u);
  auto* frontend = std::get_if<FrontendToolRequestPart>(&request->parts()[0]);
  ASSERT_NE(frontend, nullptr);
  EXPECT_EQ(frontend->id, "fe_1");
  EXPECT_EQ(stream.state(), ReplyState::AwaitingFrontend);

  ASSERT_TRUE(agent->handle_tool_result("fe_1", ToolOutput::success({text_content("notes.txt")})));

  auto response = stream.next();
  ASSERT_TRUE(response.has_value());
  ASSERT_EQ(response->tool_responses().size(), 1u);
  EXPECT_EQ(first_text(response->tool_responses()[0]->tool_result), "notes.txt");

  auto final_message = stream.next();
  ASSERT_TRUE(final_message.has_value());
  EXPECT_EQ(final_message->text(), "You picked notes.txt");
  EXPECT_FALSE(stream.next().has_value());

  // Frontend tools are offered to the model and described in the prompt
  auto first_request = provider_->request(0);
  EXPECT_TRUE(has_tool(first_request.tools, "pick_file"));
  EXPECT_NE(first_request.system_prompt.find(kDefaultFrontendInstructions), std::string::npos);
}

TEST_F(ReplyEngineTest, ApproveModeAsksAndHonoursDenial) {
  auto agent = make_agent(config_with(ExecutionMode::Approve));
  provider_->push_message(tool_request_message("c1", "math__add", {{"a", 1}, {"b", 2}}));
  provider_->push_text("Okay, I won't.");

  std::vector<events::PermissionRequested> asked;
  auto sub = Bus::instance().subscribe<events::PermissionRequested>(
      [&asked](const events::PermissionRequested& e) { asked.push_back(e); });

  auto stream = agent->reply({Message::user("add")});
  ASSERT_TRUE(stream.next().has_value());

  auto confirmation = stream.next();
  ASSERT_TRUE(confirmation.has_value());
  auto* part = std::get_if<ToolConfirmationRequestPart>(&confirmation->parts()[0]);
  ASSERT_NE(part, nullptr);
  EXPECT_EQ(part->id, "c1");
  EXPECT_EQ(part->tool_name, "math__add");
  EXPECT_EQ(part->prompt.value_or(""), "The agent would like to call the above tool. Allow? (y/n):");
  EXPECT_EQ(stream.state(), ReplyState::AwaitingApproval);

  agent->handle_confirmation("c1", PermissionConfirmation{Permission::DenyOnce});
  auto response = stream.next();
  Bus::instance().unsubscribe(sub);

  ASSERT_TRUE(response.has_value());
  ASSERT_EQ(response->tool_responses().size(), 1u);
  EXPECT_EQ(first_text(response->tool_responses()[0]->tool_result), kToolDeclinedText);
  EXPECT_EQ(tool_calls_->load(), 0);
  ASSERT_EQ(asked.size(), 1u);
  EXPECT_EQ(asked[0].tool_name, "math__add");

  auto rest = stream.collect();
  ASSERT_EQ(rest.size(), 1u);
  EXPECT_EQ(rest[0].text(), "Okay, I won't.");
}

TEST_F(ReplyEngineTest, AlwaysAllowIsRemembered) {
  auto agent = make_agent(config_with(ExecutionMode::Approve));
  provider_->push_message(tool_request_message("c1", "math__add", {{"a", 1}, {"b", 2}}));
  provider_->push_message(tool_request_message("c2", "math__add", {{"a", 3}, {"b", 4}}));
  provider_->push_text("3 and 7");

  auto stream = agent->reply({Message::user("add twice")});
  ASSERT_TRUE(stream.next().has_value());
  ASSERT_TRUE(stream.next().has_value());  // confirmation for c1
  agent->handle_confirmation("c1", PermissionConfirmation{Permission::AlwaysAllow});

  auto first = stream.next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first_text(first->tool_responses()[0]->tool_result), "3");
  EXPECT_EQ(agent->permission_store().get("math__add"), PermissionLevel::AlwaysAllow);

  // c2 runs without asking
  auto rest = stream.collect();
  ASSERT_EQ(rest.size(), 3u);
  EXPECT_EQ(first_text(rest[1].tool_responses()[0]->tool_result), "7");
  EXPECT_EQ(tool_calls_->load(), 2);
}

TEST_F(ReplyEngineTest, SmartApproveRunsReadOnlyToolsDirectly) {
  auto agent = make_agent(config_with(ExecutionMode::SmartApprove));
  provider_->push_message(tool_request_message("l1", "math__lookup"));
  provider_->push_text("found it");

  auto messages = agent->reply({Message::user("look")}).collect();
  ASSERT_EQ(messages.size(), 3u);
  EXPECT_EQ(first_text(messages[1].tool_responses()[0]->tool_result), "found");
}

TEST_F(ReplyEngineTest, ChatModeNeverDispatches) {
  auto agent = make_agent(config_with(ExecutionMode::Chat));
  provider_->push_message(tool_request_message("c1", "math__add", {{"a", 1}, {"b", 2}}));
  provider_->push_text("Here is the plan.");

  auto messages = agent->reply({Message::user("add")}).collect();
  ASSERT_EQ(messages.size(), 3u);
  EXPECT_EQ(first_text(messages[1].tool_responses()[0]->tool_result), kChatModeSkipText);
  EXPECT_EQ(tool_calls_->load(), 0);
}

TEST_F(ReplyEngineTest, EnableExtensionRefreshesCatalog) {
  auto notes = std::make_shared<FunctionExtension>("notes", "Keeps notes.");
  notes->add_tool(Tool::with_parameters("count", "Count notes", {}),
                  [](const json&) { return ToolOutput::success({text_content("2")}); });
  extensions_->register_available("notes", "Personal notes", [notes] { return notes; });

  auto agent = make_agent();
  provider_->push_message(
      tool_request_message("e1", platform_tools::kEnableExtension, {{"extension_name", "notes"}}));
  provider_->push_text("Enabled.");

  auto messages = agent->reply({Message::user("enable notes")}).collect();
  ASSERT_EQ(messages.size(), 3u);
  EXPECT_EQ(first_text(messages[1].tool_responses()[0]->tool_result),
            "The extension 'notes' has been installed successfully");

  ASSERT_EQ(provider_->calls(), 2u);
  EXPECT_FALSE(has_tool(provider_->request(0).tools, "notes__count"));
  auto second = provider_->request(1);
  EXPECT_TRUE(has_tool(second.tools, "notes__count"));
  EXPECT_TRUE(has_tool(second.tools, platform_tools::kEnableExtension));
  EXPECT_NE(second.system_prompt.find("Keeps notes."), std::string::npos);
}

TEST_F(ReplyEngineTest, EnableUnknownExtensionReportsError) {
  auto agent = make_agent();
  provider_->push_message(
      tool_request_message("e1", platform_tools::kEnableExtension, {{"extension_name", "weather"}}));
  provider_->push_text("Sorry.");

  auto messages = agent->reply({Message::user("enable weather")}).collect();
  ASSERT_EQ(messages.size(), 3u);
  const auto& result = messages[1].tool_responses()[0]->tool_result;
  ASSERT_FALSE(result.ok());
  EXPECT_NE(result.error->message.find("not found"), std::string::npos);
}

TEST_F(ReplyEngineTest, MaxTurnsStopsEndlessToolLoops) {
  EngineConfig config;
  config.max_turns = 2;
  auto agent = make_agent(config);
  for (int i = 0; i < 5; ++i) {
    provider_->push_message(tool_request_message("loop_" + std::to_string(i), "math__lookup"));
  }

  auto messages = agent->reply({Message::user("loop")}).collect();
  EXPECT_EQ(provider_->calls(), 2u);
  ASSERT_FALSE(messages.empty());
  EXPECT_EQ(messages.back().text(), "Error: Reached the limit of 2 model calls in one reply.");
}

TEST_F(ReplyEngineTest, ExtensionFailureThrowsAgentError) {
  auto agent = Agent::create(provider_, std::make_shared<BrokenExtensionManager>());
  auto stream = agent->reply({Message::user("hi")});

  try {
    stream.next();
    FAIL() << "expected AgentError";
  } catch (const AgentError& e) {
    EXPECT_EQ(e.kind(), AgentError::Kind::Extension);
    EXPECT_NE(std::string(e.what()).find("transport down"), std::string::npos);
  }
  EXPECT_EQ(stream.state(), ReplyState::Failed);
  EXPECT_FALSE(stream.next().has_value());
  EXPECT_EQ(provider_->calls(), 0u);
}

TEST_F(ReplyEngineTest, UnsatisfiableBudgetThrowsContextLimit) {
  auto agent = make_agent(config_with(ExecutionMode::Auto, ContextStrategyKind::DropOldest));
  provider_->mutable_model().with_context_limit(50);

  auto stream = agent->reply({Message::user(std::string(4000, 'x'))});
  try {
    stream.next();
    FAIL() << "expected AgentError";
  } catch (const AgentError& e) {
    EXPECT_EQ(e.kind(), AgentError::Kind::ContextLimit);
  }
  EXPECT_EQ(provider_->calls(), 0u);
}

TEST_F(ReplyEngineTest, ToolshimInterpretsTextResponses) {
  provider_->mutable_model().with_toolshim(true);
  auto agent = make_agent();
  provider_->push_text("```json\n{\"name\": \"math__add\", \"arguments\": {\"a\": 4, \"b\": 5}}\n```");
  provider_->push_text("It is 9.");

  auto messages = agent->reply({Message::user("4+5")}).collect();
  ASSERT_EQ(messages.size(), 3u);
  EXPECT_EQ(first_text(messages[1].tool_responses()[0]->tool_result), "9");

  // Tools travel in the prompt instead of the tool list
  auto first = provider_->request(0);
  EXPECT_TRUE(first.tools.empty());
  EXPECT_NE(first.system_prompt.find("math__add"), std::string::npos);
}

TEST_F(ReplyEngineTest, CancelWhileAwaitingProvider) {
  auto hanging = std::make_shared<HangingProvider>();
  auto agent = Agent::create(hanging, extensions_);
  auto stream = agent->reply({Message::user("hi")});

  std::thread canceller([&stream] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    stream.cancel();
  });

  auto message = stream.next();
  canceller.join();

  EXPECT_FALSE(message.has_value());
  EXPECT_TRUE(stream.finished());
  EXPECT_GE(hanging->cancels(), 1);
}

TEST_F(ReplyEngineTest, CancelWhileToolsRunStopsTheLoop) {
  auto slow_calls = std::make_shared<std::atomic<int>>(0);
  auto slow = std::make_shared<FunctionExtension>("slow");
  slow->add_tool(Tool::with_parameters("wait", "Takes a while", {}), [slow_calls](const json&) {
    ++*slow_calls;
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    return ToolOutput::success({text_content("finally")});
  });
  extensions_->add_extension(slow);

  auto agent = make_agent();
  provider_->push_message(tool_request_message("w1", "slow__wait"));
  provider_->push_text("should never be requested");

  int completed = 0;
  auto sub = Bus::instance().subscribe<events::ToolCallCompleted>(
      [&completed](const events::ToolCallCompleted&) { ++completed; });

  auto stream = agent->reply({Message::user("wait for it")});
  ASSERT_TRUE(stream.next().has_value());
  EXPECT_EQ(stream.state(), ReplyState::AwaitingTools);

  std::thread canceller([&stream] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    stream.cancel();
  });

  auto started = std::chrono::steady_clock::now();
  auto message = stream.next();
  auto elapsed = std::chrono::steady_clock::now() - started;
  canceller.join();

  EXPECT_FALSE(message.has_value());
  EXPECT_TRUE(stream.finished());
  EXPECT_LT(elapsed, std::chrono::milliseconds(250));
  EXPECT_EQ(slow_calls->load(), 1);

  // Let the abandoned call finish; its result goes nowhere
  std::this_thread::sleep_for(std::chrono::milliseconds(350));
  Bus::instance().unsubscribe(sub);
  EXPECT_EQ(completed, 0);
  EXPECT_EQ(provider_->calls(), 1u);
  EXPECT_FALSE(stream.next().has_value());
}

TEST_F(ReplyEngineTest, DroppingStreamDuringToolsStopsTheLoop) {
  auto slow = std::make_shared<FunctionExtension>("slow");
  slow->add_tool(Tool::with_parameters("wait", "Takes a while", {}), [](const json&) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    return ToolOutput::success({text_content("finally")});
  });
  extensions_->add_extension(slow);

  auto agent = make_agent();
  provider_->push_message(tool_request_message("w1", "slow__wait"));

  {
    auto stream = agent->reply({Message::user("wait for it")});
    ASSERT_TRUE(stream.next().has_value());
    EXPECT_EQ(stream.state(), ReplyState::AwaitingTools);
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(250));
  EXPECT_EQ(provider_->calls(), 1u);

  provider_->push_text("fresh start");
  auto messages = agent->reply({Message::user("hello")}).collect();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].text(), "fresh start");
}

TEST_F(ReplyEngineTest, DroppedStreamReleasesAgent) {
  auto agent = make_agent();
  agent->add_frontend_tools({Tool::with_parameters("pick_file", "Ask the user for a file", {})});
  provider_->push_message(tool_request_message("fe_1", "pick_file"));

  {
    auto stream = agent->reply({Message::user("open")});
    ASSERT_TRUE(stream.next().has_value());
    ASSERT_TRUE(stream.next().has_value());
    // Abandoned while the frontend result is pending
  }

  provider_->push_text("fresh start");
  auto messages = agent->reply({Message::user("hello")}).collect();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].text(), "fresh start");
  EXPECT_EQ(agent->list_tools().size(), 2u);
}

TEST_F(ReplyEngineTest, FailedToolListingReleasesExtensions) {
  class FlakyExtensionManager : public LocalExtensionManager {
   public:
    FlakyExtensionManager() : LocalExtensionManager(4) {}
    Result<std::vector<Tool>> get_prefixed_tools() override {
      if (fail_next.exchange(false)) {
        throw std::runtime_error("listing failed");
      }
      return LocalExtensionManager::get_prefixed_tools();
    }
    std::atomic<bool> fail_next{true};
  };

  auto flaky = std::make_shared<FlakyExtensionManager>();
  flaky->add_extension(make_math(tool_calls_));
  auto agent = Agent::create(provider_, flaky, EngineConfig{});

  EXPECT_THROW(agent->list_tools(), std::runtime_error);

  provider_->push_text("still here");
  auto start = std::chrono::steady_clock::now();
  auto messages = agent->reply({Message::user("hi")}).collect();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].text(), "still here");
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
  EXPECT_EQ(agent->list_tools().size(), 2u);
}

TEST_F(ReplyEngineTest, LateFrontendResultOfDroppedStreamIsDiscarded) {
  auto agent = make_agent();
  agent->add_frontend_tools({Tool::with_parameters("pick_file", "Ask the user for a file", {})});
  provider_->push_message(tool_request_message("fe_1", "pick_file"));

  {
    auto stream = agent->reply({Message::user("open")});
    ASSERT_TRUE(stream.next().has_value());
    ASSERT_TRUE(stream.next().has_value());
  }
  // The frontend answers after the stream is gone
  ASSERT_TRUE(agent->handle_tool_result("fe_1", ToolOutput::success({text_content("stale.txt")})));

  provider_->push_message(tool_request_message("fe_1", "pick_file"));
  provider_->push_text("opened");

  auto stream = agent->reply({Message::user("open again")});
  ASSERT_TRUE(stream.next().has_value());
  ASSERT_TRUE(stream.next().has_value());
  ASSERT_TRUE(agent->handle_tool_result("fe_1", ToolOutput::success({text_content("fresh.txt")})));

  auto response = stream.next();
  ASSERT_TRUE(response.has_value());
  ASSERT_EQ(response->tool_responses().size(), 1u);
  EXPECT_EQ(first_text(response->tool_responses()[0]->tool_result), "fresh.txt");
}

TEST_F(ReplyEngineTest, PublishesLifecycleEvents) {
  auto agent = make_agent();
  provider_->push_message(tool_request_message("c1", "math__lookup"));
  provider_->push_text("done");

  std::vector<events::ReplyEnded> ended;
  int started = 0;
  int completed_tools = 0;
  auto& bus = Bus::instance();
  auto s1 = bus.subscribe<events::ReplyStarted>([&started](const events::ReplyStarted&) { ++started; });
  auto s2 = bus.subscribe<events::ReplyEnded>([&ended](const events::ReplyEnded& e) { ended.push_back(e); });
  auto s3 = bus.subscribe<events::ToolCallCompleted>(
      [&completed_tools](const events::ToolCallCompleted& e) { completed_tools += e.success ? 1 : 0; });

  auto dir = fs::temp_directory_path() / ("converse_reply_events_" + UUID::short_id("run"));
  agent->set_session_dir(dir);
  agent->reply({Message::user("look")}, SessionConfig{"events-session", "/tmp"}).collect();
  bus.unsubscribe(s1);
  bus.unsubscribe(s2);
  bus.unsubscribe(s3);
  fs::remove_all(dir);

  EXPECT_EQ(started, 1);
  EXPECT_EQ(completed_tools, 1);
  ASSERT_EQ(ended.size(), 1u);
  EXPECT_TRUE(ended[0].success);
  EXPECT_EQ(ended[0].turns, 2u);
  EXPECT_EQ(ended[0].session_id, "events-session");
}

TEST_F(ReplyEngineTest, UpdatesSessionMetrics) {
  auto dir = fs::temp_directory_path() / ("converse_reply_metrics_" + UUID::short_id("run"));
  auto agent = make_agent();
  agent->set_session_dir(dir);
  provider_->push_text("hi back");

  agent->reply({Message::user("hi")}, SessionConfig{"metrics", "/work"}).collect();

  SessionLog log(SessionLog::path_for(dir, "metrics"));
  ASSERT_TRUE(log.exists());
  auto meta = log.read_metadata();
  EXPECT_EQ(meta.working_dir, "/work");
  EXPECT_EQ(meta.message_count, 2u);
  EXPECT_EQ(meta.input_tokens.value_or(0), 100);
  EXPECT_EQ(meta.output_tokens.value_or(0), 10);
  EXPECT_EQ(meta.total_tokens.value_or(0), 110);

  fs::remove_all(dir);
}

TEST_F(ReplyEngineTest, SystemPromptExtrasAndOverride) {
  auto agent = make_agent();
  agent->extend_system_prompt("Always answer in French.");
  provider_->push_text("Bonjour");
  agent->reply({Message::user("hi")}).collect();
  EXPECT_NE(provider_->request(0).system_prompt.find("Always answer in French."), std::string::npos);

  agent->override_system_prompt("Custom base.\n{{extensions}}");
  provider_->push_text("ok");
  agent->reply({Message::user("hi")}).collect();
  auto prompt = provider_->request(1).system_prompt;
  EXPECT_EQ(prompt.rfind("Custom base.", 0), 0u);
  EXPECT_NE(prompt.find("math"), std::string::npos);
}
