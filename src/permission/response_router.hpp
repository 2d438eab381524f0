#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

#include "core/types.hpp"
#include "permission/bounded_channel.hpp"

namespace converse {

// Correlates responses arriving on a shared channel with the request id a reader waits for.
// Responses for other ids are kept until their reader asks, up to stash_limit of them.
template <typename T>
class ResponseRouter {
 public:
  using Item = std::pair<RequestId, T>;

  explicit ResponseRouter(size_t capacity, size_t stash_limit = 256)
      : channel_(capacity), stash_limit_(std::max<size_t>(stash_limit, 1)) {}

  // Blocks while the channel is full
  bool send(const RequestId& id, T value) {
    return channel_.send(Item{id, std::move(value)});
  }

  // nullopt when aborted or the channel was closed
  std::optional<T> wait(const RequestId& id, const std::shared_ptr<std::atomic<bool>>& abort,
                        std::chrono::milliseconds poll = std::chrono::milliseconds(20)) {
    while (true) {
      if (auto stashed = take_stashed(id)) {
        return stashed;
      }
      if (abort && abort->load()) {
        return std::nullopt;
      }

      auto item = channel_.receive_for(poll);
      if (!item) {
        if (channel_.closed()) return take_stashed(id);
        continue;
      }
      if (drop_if_discarded(item->first)) {
        continue;
      }
      if (item->first == id) {
        return std::move(item->second);
      }

      stash(std::move(*item));
    }
  }

  // Nobody will wait for id any more: drop its stashed response and any that arrives later
  void discard(const RequestId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unstash(id)) return;
    if (discarded_.size() >= stash_limit_) discarded_.pop_front();
    discarded_.push_back(id);
  }

  size_t stashed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stash_.size();
  }

  void close() {
    channel_.close();
  }

 private:
  std::optional<T> take_stashed(const RequestId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stash_.find(id);
    if (it == stash_.end()) return std::nullopt;
    T value = std::move(it->second);
    unstash(id);
    return value;
  }

  bool drop_if_discarded(const RequestId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(discarded_.begin(), discarded_.end(), id);
    if (it == discarded_.end()) return false;
    spdlog::debug("[ResponseRouter] Dropping late response for {}", id);
    discarded_.erase(it);
    return true;
  }

  void stash(Item item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stash_.find(item.first) == stash_.end()) {
      if (stash_.size() >= stash_limit_) {
        RequestId oldest = order_.front();
        spdlog::warn("[ResponseRouter] Stash full, dropping unclaimed response for {}", oldest);
        unstash(oldest);
      }
      order_.push_back(item.first);
    }
    stash_.insert_or_assign(item.first, std::move(item.second));
  }

  // Caller holds mutex_
  bool unstash(const RequestId& id) {
    if (stash_.erase(id) == 0) return false;
    order_.erase(std::find(order_.begin(), order_.end(), id));
    return true;
  }

  BoundedChannel<Item> channel_;
  size_t stash_limit_;
  mutable std::mutex mutex_;
  std::map<RequestId, T> stash_;
  std::deque<RequestId> order_;
  std::deque<RequestId> discarded_;
};

}  // namespace converse
