#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace converse {

using json = nlohmann::json;

// Forward declarations
class Message;

class Agent;

// Type aliases
using SessionId = std::string;
using MessageId = std::string;
using RequestId = std::string;

using Timestamp = std::chrono::system_clock::time_point;

// Result type for operations that can fail
template <typename T, typename E = std::string>
struct Result {
  std::optional<T> value;
  std::optional<E> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(E err) {
    return Result{std::nullopt, std::move(err)};
  }
};

// Token usage tracking
struct TokenUsage {
  int64_t input_tokens = 0;
  int64_t output_tokens = 0;

  int64_t total() const {
    return input_tokens + output_tokens;
  }

  TokenUsage &operator+=(const TokenUsage &other) {
    input_tokens += other.input_tokens;
    output_tokens += other.output_tokens;
    return *this;
  }
};

// Opaque session handle threaded through to usage hooks
struct SessionConfig {
  SessionId id;
  std::string working_dir;
};

// Epoch helpers shared by serializers
int64_t timestamp_to_epoch(const Timestamp &ts);

Timestamp epoch_to_timestamp(int64_t epoch);

// Replace invalid UTF-8 sequences with U+FFFD
std::string sanitize_utf8(const std::string &input);

}  // namespace converse
