#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/message.hpp"
#include "core/types.hpp"
#include "llm/model_config.hpp"
#include "tool/tool.hpp"

namespace converse {

// Typed failure of a completion request
struct ProviderError {
  enum class Kind {
    Authentication,
    RateLimitExceeded,
    ServerError,
    ContextLengthExceeded,
    RequestFailed,
    ExecutionError,
    UsageError,
    ResponseParseError
  };

  Kind kind = Kind::RequestFailed;
  std::string message;

  static ProviderError context_length_exceeded(std::string msg) {
    return ProviderError{Kind::ContextLengthExceeded, std::move(msg)};
  }

  static ProviderError execution(std::string msg) {
    return ProviderError{Kind::ExecutionError, std::move(msg)};
  }

  // Transient errors a caller may retry
  bool is_retryable() const {
    return kind == Kind::RateLimitExceeded || kind == Kind::ServerError;
  }

  std::string to_string() const;
};

std::string to_string(ProviderError::Kind kind);

struct LlmRequest {
  std::string system_prompt;
  std::vector<Message> messages;
  std::vector<Tool> tools;
};

struct LlmResponse {
  Message message;
  TokenUsage usage;
  std::string model;
  std::optional<ProviderError> error;

  bool ok() const {
    return !error.has_value();
  }

  static LlmResponse failure(ProviderError err) {
    LlmResponse response;
    response.error = std::move(err);
    return response;
  }
};

// Abstract LLM provider interface
class Provider {
 public:
  virtual ~Provider() = default;

  virtual std::string name() const = 0;

  virtual const ModelConfig& model_config() const = 0;

  // Non-streaming completion
  virtual std::future<LlmResponse> complete(const LlmRequest& request) = 0;

  // Cancel the in-flight request, if any
  virtual void cancel() = 0;
};

}  // namespace converse
