#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "converse.hpp"
#include "spdlog/cfg/env.h"

using namespace converse;

// Scripted provider: asks for the calculator once per question, then reports the result
class ScriptedProvider : public Provider {
 public:
  ScriptedProvider() : model_(ModelConfig("scripted").with_context_limit(8192)) {}

  std::string name() const override {
    return "scripted";
  }

  const ModelConfig& model_config() const override {
    return model_;
  }

  std::future<LlmResponse> complete(const LlmRequest& request) override {
    std::promise<LlmResponse> promise;
    auto future = promise.get_future();

    LlmResponse response;
    response.model = model_.model_name;
    response.usage.input_tokens = static_cast<int64_t>(request.messages.size()) * 10;
    response.usage.output_tokens = 12;

    const Message& last = request.messages.back();
    if (last.has_tool_response()) {
      response.message = Message::assistant("The calculator says: " + last.as_concat_text());
    } else {
      json args = {{"a", static_cast<double>(last.text().size())}, {"b", 1}};
      response.message = Message::assistant("Let me count the characters of your message plus one.");
      response.message.add_tool_request(UUID::short_id("call"), ToolCallResult::success(ToolCall{"calculator__add", args}));
    }
    promise.set_value(std::move(response));
    return future;
  }

  void cancel() override {}

 private:
  ModelConfig model_;
};

static std::atomic<ReplyStream*> g_stream{nullptr};

static void sigint_handler(int) {
  if (auto* stream = g_stream.load()) {
    stream->cancel();
  } else {
    std::signal(SIGINT, SIG_DFL);
    std::raise(SIGINT);
  }
}

static std::shared_ptr<Extension> make_calculator() {
  auto calculator = std::make_shared<FunctionExtension>("calculator", "Use the calculator for arithmetic.");
  auto add = Tool::with_parameters("add", "Add two numbers",
                                   {{"a", "number", "First operand"}, {"b", "number", "Second operand"}});
  add.annotations = ToolAnnotations{true, false};
  calculator->add_tool(add, [](const json& args) {
    double sum = args.value("a", 0.0) + args.value("b", 0.0);
    return ToolOutput::success({text_content(std::to_string(sum))});
  });
  return calculator;
}

int main() {
  spdlog::cfg::load_env_levels();

  auto config = EngineConfig::from_env();
  init(config);

  auto extensions = std::make_shared<LocalExtensionManager>(config.dispatch_threads);
  extensions->add_extension(make_calculator());

  auto agent = Agent::create(std::make_shared<ScriptedProvider>(), extensions, config);
  std::signal(SIGINT, sigint_handler);

  std::cout << "converse " << version() << " - Simple Chat Example (mode " << to_string(config.mode) << ")\n";
  std::cout << "Type a message, /q to exit.\n\n> " << std::flush;

  std::vector<Message> history;
  SessionConfig session{UUID::generate(), std::filesystem::current_path().string()};

  std::string line;
  while (std::getline(std::cin, line)) {
    if (line == "/q") break;
    if (line.empty()) {
      std::cout << "> " << std::flush;
      continue;
    }

    history.push_back(Message::user(line));
    auto stream = agent->reply(history, session);
    g_stream.store(&stream);

    // Tool exchanges stay inside the reply; the history keeps the final answer only
    std::optional<Message> last_assistant;

    try {
      while (auto message = stream.next()) {
        for (const auto& part : message->parts()) {
          if (auto* confirm = std::get_if<ToolConfirmationRequestPart>(&part)) {
            std::cout << "[" << confirm->tool_name << " " << confirm->arguments.dump() << "]\n"
                      << confirm->prompt.value_or("Allow? (y/n):") << " " << std::flush;
            std::string answer;
            std::getline(std::cin, answer);
            Permission permission = (answer == "y" || answer == "Y") ? Permission::AllowOnce : Permission::DenyOnce;
            agent->handle_confirmation(confirm->id, PermissionConfirmation{permission});
          } else if (auto* response = std::get_if<ToolResponsePart>(&part)) {
            std::cout << "[Tool " << response->id << " " << (response->tool_result.ok() ? "completed" : "failed")
                      << "]\n";
          }
        }

        if (message->role() == Role::Assistant && !message->text().empty()) {
          std::cout << message->text() << "\n";
          last_assistant = Message::assistant(message->text());
        }
      }
    } catch (const AgentError& e) {
      std::cout << "\n[Error] " << e.what() << "\n";
    }

    g_stream.store(nullptr);
    if (last_assistant) {
      history.push_back(std::move(*last_assistant));
    } else {
      history.pop_back();
    }
    std::cout << "\n> " << std::flush;
  }

  shutdown();
  return 0;
}
