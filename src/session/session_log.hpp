#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "core/message.hpp"
#include "core/types.hpp"

namespace converse {

// First line of a session log
struct SessionMetadata {
  std::string description;
  std::string working_dir;
  size_t message_count = 0;
  std::optional<int64_t> total_tokens;
  std::optional<int64_t> input_tokens;
  std::optional<int64_t> output_tokens;

  json to_json() const;
  static SessionMetadata from_json(const json &j);
};

// Append-only JSONL session file:
//   line 1      metadata
//   line 2..n   one message per line
class SessionLog {
 public:
  explicit SessionLog(std::filesystem::path path);

  // <dir>/<session id>.jsonl
  static std::filesystem::path path_for(const std::filesystem::path &dir, const SessionId &id);

  // ~/.config/converse/sessions
  static std::filesystem::path default_dir();

  const std::filesystem::path &path() const {
    return path_;
  }

  bool exists() const;

  // Unparseable lines are skipped with a warning
  std::vector<Message> read_messages() const;

  // Defaults when the file is missing or its first line is invalid
  SessionMetadata read_metadata() const;

  // Replaces the file atomically
  bool write_messages(const std::vector<Message> &messages, const SessionMetadata &metadata);

  bool append(const Message &message);

  // Rewrites the first line, keeping the messages
  bool update_metadata(const SessionMetadata &metadata);

 private:
  bool atomic_write(const std::string &content);

  std::filesystem::path path_;
  mutable std::mutex mutex_;
};

}  // namespace converse
