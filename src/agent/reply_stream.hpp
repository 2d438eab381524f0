#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/message.hpp"
#include "core/types.hpp"

namespace converse {

class Agent;

namespace detail {
class ReplyLoop;
}

enum class ReplyState {
  Preparing,
  AwaitingProvider,
  AwaitingFrontend,
  AwaitingApproval,
  AwaitingTools,
  Done,
  Failed
};

std::string to_string(ReplyState state);

/**
 * Lazy sequence of messages produced by one Agent::reply() call.
 *
 * Each next() runs the loop until a message is ready: the assistant response,
 * frontend tool requests, confirmation requests and tool responses are handed
 * out as they are produced. Work happens only inside next(); dropping the
 * stream cancels it, and results of tool calls still in flight are discarded.
 *
 * next() blocks while waiting on the provider, on tool calls, or on
 * Agent::handle_confirmation / Agent::handle_tool_result for a request it has
 * just yielded. Drive a stream from one thread at a time.
 */
class ReplyStream {
 public:
  ReplyStream(ReplyStream&& other) noexcept;
  ReplyStream& operator=(ReplyStream&& other) noexcept;
  ~ReplyStream();

  ReplyStream(const ReplyStream&) = delete;
  ReplyStream& operator=(const ReplyStream&) = delete;

  // nullopt once the reply is complete or cancelled; throws AgentError on hard failure
  std::optional<Message> next();

  // Safe to call from another thread
  void cancel();

  bool finished() const;

  ReplyState state() const;

  // Drain the stream
  std::vector<Message> collect();

 private:
  friend class Agent;

  explicit ReplyStream(std::unique_ptr<detail::ReplyLoop> loop);

  static ReplyStream start(std::shared_ptr<Agent> agent, std::vector<Message> messages,
                           std::optional<SessionConfig> session);

  std::unique_ptr<detail::ReplyLoop> loop_;
};

}  // namespace converse
