#include "session/session_log.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

#include "core/config.hpp"

namespace converse {

namespace fs = std::filesystem;

// --- SessionMetadata ---

json SessionMetadata::to_json() const {
  json j;
  j["description"] = description;
  j["working_dir"] = working_dir;
  j["message_count"] = message_count;
  j["total_tokens"] = total_tokens ? json(*total_tokens) : json(nullptr);
  j["input_tokens"] = input_tokens ? json(*input_tokens) : json(nullptr);
  j["output_tokens"] = output_tokens ? json(*output_tokens) : json(nullptr);
  return j;
}

SessionMetadata SessionMetadata::from_json(const json &j) {
  SessionMetadata meta;
  meta.description = j.value("description", "");
  meta.working_dir = j.value("working_dir", "");
  meta.message_count = j.value("message_count", size_t(0));

  auto optional_int = [&j](const char *key) -> std::optional<int64_t> {
    if (j.contains(key) && j[key].is_number_integer()) {
      return j[key].get<int64_t>();
    }
    return std::nullopt;
  };
  meta.total_tokens = optional_int("total_tokens");
  meta.input_tokens = optional_int("input_tokens");
  meta.output_tokens = optional_int("output_tokens");
  return meta;
}

// --- SessionLog ---

SessionLog::SessionLog(fs::path path) : path_(std::move(path)) {}

fs::path SessionLog::path_for(const fs::path &dir, const SessionId &id) {
  return dir / (id + ".jsonl");
}

fs::path SessionLog::default_dir() {
  return config_paths::config_dir() / "sessions";
}

bool SessionLog::exists() const {
  return fs::exists(path_);
}

std::vector<Message> SessionLog::read_messages() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Message> messages;

  std::ifstream file(path_);
  if (!file.is_open()) {
    return messages;
  }

  std::string line;
  bool first = true;
  size_t line_no = 0;
  while (std::getline(file, line)) {
    ++line_no;
    if (first) {
      first = false;
      continue;
    }
    if (line.empty()) continue;

    try {
      messages.push_back(Message::from_json(json::parse(line)));
    } catch (const std::exception &e) {
      spdlog::warn("[SessionLog] Skipping line {} of {}: {}", line_no, path_.string(), e.what());
    }
  }

  return messages;
}

SessionMetadata SessionLog::read_metadata() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::ifstream file(path_);
  if (!file.is_open()) {
    return SessionMetadata{};
  }

  std::string line;
  if (!std::getline(file, line)) {
    return SessionMetadata{};
  }

  try {
    return SessionMetadata::from_json(json::parse(line));
  } catch (const std::exception &e) {
    spdlog::warn("[SessionLog] Invalid metadata in {}: {}", path_.string(), e.what());
  }
  return SessionMetadata{};
}

bool SessionLog::atomic_write(const std::string &content) {
  std::error_code ec;
  if (path_.has_parent_path()) {
    fs::create_directories(path_.parent_path(), ec);
  }

  auto tmp_path = path_;
  tmp_path += ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file.is_open()) {
    spdlog::warn("[SessionLog] Failed to open temp file for writing: {}", tmp_path.string());
    return false;
  }

  file << content;
  file.close();

  if (file.fail()) {
    spdlog::warn("[SessionLog] Failed to write temp file: {}", tmp_path.string());
    fs::remove(tmp_path, ec);
    return false;
  }

  fs::rename(tmp_path, path_, ec);
  if (ec) {
    spdlog::warn("[SessionLog] Failed to rename {} -> {}: {}", tmp_path.string(), path_.string(), ec.message());
    fs::remove(tmp_path, ec);
    return false;
  }
  return true;
}

bool SessionLog::write_messages(const std::vector<Message> &messages, const SessionMetadata &metadata) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::ostringstream out;
  out << metadata.to_json().dump() << "\n";
  for (const auto &msg : messages) {
    out << msg.to_json().dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
  }
  return atomic_write(out.str());
}

bool SessionLog::append(const Message &message) {
  if (!exists()) {
    SessionMetadata metadata;
    metadata.working_dir = fs::current_path().string();
    if (!write_messages({}, metadata)) {
      return false;
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::ofstream file(path_, std::ios::app);
  if (!file.is_open()) {
    spdlog::warn("[SessionLog] Failed to open {} for append", path_.string());
    return false;
  }
  file << message.to_json().dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
  return !file.fail();
}

bool SessionLog::update_metadata(const SessionMetadata &metadata) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::ostringstream out;
  out << metadata.to_json().dump() << "\n";

  // Message lines are copied as stored, unreadable ones included
  std::ifstream file(path_);
  if (file.is_open()) {
    std::string line;
    bool first = true;
    while (std::getline(file, line)) {
      if (first) {
        first = false;
        continue;
      }
      out << line << "\n";
    }
  }
  file.close();
  return atomic_write(out.str());
}

}  // namespace converse
