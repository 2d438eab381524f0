#pragma once

#include <any>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <vector>

namespace converse {

// Type-safe event bus for engine observers
class Bus {
 public:
  using SubscriptionId = uint64_t;

  static Bus &instance();

  // Subscribe to events of type T
  template <typename T>
  SubscriptionId subscribe(std::function<void(const T &)> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    auto type_idx = std::type_index(typeid(T));

    handlers_[type_idx].push_back({id, [handler](const std::any &event) {
                                     handler(std::any_cast<const T &>(event));
                                   }});

    return id;
  }

  void unsubscribe(SubscriptionId id);

  template <typename T>
  void publish(const T &event) {
    std::vector<std::function<void(const std::any &)>> to_call;

    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = handlers_.find(std::type_index(typeid(T)));
      if (it != handlers_.end()) {
        for (const auto &entry : it->second) {
          to_call.push_back(entry.handler);
        }
      }
    }

    // Handlers run outside the lock so they may publish in turn
    std::any wrapped = event;
    for (const auto &handler : to_call) {
      handler(wrapped);
    }
  }

 private:
  Bus() = default;

  struct HandlerEntry {
    SubscriptionId id;
    std::function<void(const std::any &)> handler;
  };

  std::mutex mutex_;
  SubscriptionId next_id_ = 1;
  std::map<std::type_index, std::vector<HandlerEntry>> handlers_;
};

namespace events {

struct ReplyStarted {
  std::string session_id;
  size_t message_count;
};

struct ReplyEnded {
  std::string session_id;
  size_t turns;
  bool success;
};

struct ToolCallStarted {
  std::string session_id;
  std::string request_id;
  std::string tool_name;
};

struct ToolCallCompleted {
  std::string session_id;
  std::string request_id;
  std::string tool_name;
  bool success;
};

struct TokensUsed {
  std::string session_id;
  int64_t input_tokens;
  int64_t output_tokens;
};

struct ContextTruncated {
  std::string session_id;
  size_t messages_before;
  size_t messages_after;
  int attempt;
};

struct PermissionRequested {
  std::string session_id;
  std::string request_id;
  std::string tool_name;
};

}  // namespace events

}  // namespace converse
