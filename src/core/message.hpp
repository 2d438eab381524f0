#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/content.hpp"
#include "core/types.hpp"
#include "core/uuid.hpp"

namespace converse {

// Message part types
struct TextPart {
  std::string text;
};

struct ImagePart {
  std::string data;  // base64
  std::string mime_type;
};

struct ToolRequestPart {
  RequestId id;
  ToolCallResult tool_call;
};

struct ToolResponsePart {
  RequestId id;
  ToolOutput tool_result;
};

// Asks the caller to approve a tool call before it runs
struct ToolConfirmationRequestPart {
  RequestId id;
  std::string tool_name;
  json arguments;
  std::optional<std::string> prompt;
};

// A tool call that must be executed by the frontend
struct FrontendToolRequestPart {
  RequestId id;
  ToolCallResult tool_call;
};

using MessagePart = std::variant<
    TextPart,
    ImagePart,
    ToolRequestPart,
    ToolResponsePart,
    ToolConfirmationRequestPart,
    FrontendToolRequestPart
>;

// Message role
enum class Role {
  User,
  Assistant
};

std::string to_string(Role role);
Role role_from_string(const std::string& str);

class Message {
 public:
  Message() = default;
  Message(Role role, const std::string& content);

  // Factory methods
  static Message user(const std::string& content = "");
  static Message assistant(const std::string& content = "");

  // Accessors
  const MessageId& id() const { return id_; }
  Role role() const { return role_; }
  Timestamp created_at() const { return created_at_; }
  const std::vector<MessagePart>& parts() const { return parts_; }

  // Part manipulation
  Message& add_part(MessagePart part);
  Message& add_text(const std::string& text);
  Message& add_image(const std::string& data, const std::string& mime_type);
  Message& add_tool_request(const RequestId& id, ToolCallResult tool_call);
  Message& add_tool_response(const RequestId& id, ToolOutput result);
  Message& add_tool_confirmation_request(const RequestId& id, const std::string& tool_name,
                                         const json& arguments, std::optional<std::string> prompt = std::nullopt);
  Message& add_frontend_tool_request(const RequestId& id, ToolCallResult tool_call);

  // Get text content (newline joined)
  std::string text() const;

  // Text parts plus tool response text, space joined
  std::string as_concat_text() const;

  std::vector<const ToolRequestPart*> tool_requests() const;
  std::vector<const ToolResponsePart*> tool_responses() const;

  bool has_tool_request() const;
  bool has_tool_response() const;

  bool empty() const { return parts_.empty(); }

  // Copy of this message without its tool requests
  Message without_tool_requests() const;

  // Serialization
  json to_json() const;
  static Message from_json(const json& j);

 private:
  MessageId id_ = UUID::generate();
  Role role_ = Role::User;
  Timestamp created_at_ = std::chrono::system_clock::now();
  std::vector<MessagePart> parts_;
};

}  // namespace converse
