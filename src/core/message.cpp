#include "core/message.hpp"

namespace converse {

namespace {

json tool_call_result_to_json(const ToolCallResult &call) {
  if (call.ok()) {
    return {{"ok", call.value->to_json()}};
  }
  return {{"error", call.error ? call.error->to_json() : json::object()}};
}

ToolCallResult tool_call_result_from_json(const json &j) {
  if (j.contains("ok")) {
    return ToolCallResult::success(ToolCall::from_json(j["ok"]));
  }
  return ToolCallResult::failure(ToolError::from_json(j.value("error", json::object())));
}

}  // namespace

std::string to_string(Role role) {
  switch (role) {
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
  }
  return "user";
}

Role role_from_string(const std::string &str) {
  if (str == "assistant") return Role::Assistant;
  return Role::User;
}

Message::Message(Role role, const std::string &content) : role_(role) {
  if (!content.empty()) {
    parts_.push_back(TextPart{content});
  }
}

Message Message::user(const std::string &content) {
  return Message(Role::User, content);
}

Message Message::assistant(const std::string &content) {
  return Message(Role::Assistant, content);
}

Message &Message::add_part(MessagePart part) {
  parts_.push_back(std::move(part));
  return *this;
}

Message &Message::add_text(const std::string &text) {
  parts_.push_back(TextPart{text});
  return *this;
}

Message &Message::add_image(const std::string &data, const std::string &mime_type) {
  parts_.push_back(ImagePart{data, mime_type});
  return *this;
}

Message &Message::add_tool_request(const RequestId &id, ToolCallResult tool_call) {
  parts_.push_back(ToolRequestPart{id, std::move(tool_call)});
  return *this;
}

Message &Message::add_tool_response(const RequestId &id, ToolOutput result) {
  parts_.push_back(ToolResponsePart{id, std::move(result)});
  return *this;
}

Message &Message::add_tool_confirmation_request(const RequestId &id, const std::string &tool_name, const json &arguments,
                                                std::optional<std::string> prompt) {
  parts_.push_back(ToolConfirmationRequestPart{id, tool_name, arguments, std::move(prompt)});
  return *this;
}

Message &Message::add_frontend_tool_request(const RequestId &id, ToolCallResult tool_call) {
  parts_.push_back(FrontendToolRequestPart{id, std::move(tool_call)});
  return *this;
}

std::string Message::text() const {
  std::string result;
  for (const auto &part : parts_) {
    if (auto *text = std::get_if<TextPart>(&part)) {
      if (!result.empty()) result += "\n";
      result += text->text;
    }
  }
  return result;
}

std::string Message::as_concat_text() const {
  std::string result;
  auto append = [&result](const std::string &s) {
    if (s.empty()) return;
    if (!result.empty()) result += " ";
    result += s;
  };

  for (const auto &part : parts_) {
    if (auto *text = std::get_if<TextPart>(&part)) {
      append(text->text);
    } else if (auto *resp = std::get_if<ToolResponsePart>(&part)) {
      if (resp->tool_result.ok()) {
        for (const auto &content : *resp->tool_result.value) {
          append(content_text(content));
        }
      }
    }
  }
  return result;
}

std::vector<const ToolRequestPart *> Message::tool_requests() const {
  std::vector<const ToolRequestPart *> result;
  for (const auto &part : parts_) {
    if (auto *req = std::get_if<ToolRequestPart>(&part)) {
      result.push_back(req);
    }
  }
  return result;
}

std::vector<const ToolResponsePart *> Message::tool_responses() const {
  std::vector<const ToolResponsePart *> result;
  for (const auto &part : parts_) {
    if (auto *resp = std::get_if<ToolResponsePart>(&part)) {
      result.push_back(resp);
    }
  }
  return result;
}

bool Message::has_tool_request() const {
  for (const auto &part : parts_) {
    if (std::holds_alternative<ToolRequestPart>(part)) return true;
  }
  return false;
}

bool Message::has_tool_response() const {
  for (const auto &part : parts_) {
    if (std::holds_alternative<ToolResponsePart>(part)) return true;
  }
  return false;
}

Message Message::without_tool_requests() const {
  Message filtered = *this;
  filtered.parts_.clear();
  for (const auto &part : parts_) {
    if (!std::holds_alternative<ToolRequestPart>(part)) {
      filtered.parts_.push_back(part);
    }
  }
  return filtered;
}

json Message::to_json() const {
  json j;
  j["id"] = id_;
  j["role"] = to_string(role_);
  j["created"] = timestamp_to_epoch(created_at_);

  json parts_json = json::array();
  for (const auto &part : parts_) {
    json part_json;
    if (auto *text = std::get_if<TextPart>(&part)) {
      part_json["type"] = "text";
      part_json["text"] = text->text;
    } else if (auto *image = std::get_if<ImagePart>(&part)) {
      part_json["type"] = "image";
      part_json["data"] = image->data;
      part_json["mime_type"] = image->mime_type;
    } else if (auto *req = std::get_if<ToolRequestPart>(&part)) {
      part_json["type"] = "tool_request";
      part_json["id"] = req->id;
      part_json["tool_call"] = tool_call_result_to_json(req->tool_call);
    } else if (auto *resp = std::get_if<ToolResponsePart>(&part)) {
      part_json["type"] = "tool_response";
      part_json["id"] = resp->id;
      part_json["tool_result"] = tool_output_to_json(resp->tool_result);
    } else if (auto *confirm = std::get_if<ToolConfirmationRequestPart>(&part)) {
      part_json["type"] = "tool_confirmation_request";
      part_json["id"] = confirm->id;
      part_json["tool_name"] = confirm->tool_name;
      part_json["arguments"] = confirm->arguments;
      if (confirm->prompt) {
        part_json["prompt"] = *confirm->prompt;
      }
    } else if (auto *frontend = std::get_if<FrontendToolRequestPart>(&part)) {
      part_json["type"] = "frontend_tool_request";
      part_json["id"] = frontend->id;
      part_json["tool_call"] = tool_call_result_to_json(frontend->tool_call);
    }
    parts_json.push_back(part_json);
  }
  j["content"] = parts_json;

  return j;
}

Message Message::from_json(const json &j) {
  Message msg;
  msg.id_ = j.value("id", UUID::generate());
  msg.role_ = role_from_string(j.value("role", "user"));
  if (j.contains("created")) {
    msg.created_at_ = epoch_to_timestamp(j["created"].get<int64_t>());
  }

  if (j.contains("content")) {
    for (const auto &part_json : j["content"]) {
      std::string type = part_json.value("type", "");
      if (type == "text") {
        msg.parts_.push_back(TextPart{part_json.value("text", "")});
      } else if (type == "image") {
        msg.parts_.push_back(ImagePart{part_json.value("data", ""), part_json.value("mime_type", "")});
      } else if (type == "tool_request") {
        msg.parts_.push_back(ToolRequestPart{part_json.value("id", ""), tool_call_result_from_json(part_json.value("tool_call", json::object()))});
      } else if (type == "tool_response") {
        msg.parts_.push_back(ToolResponsePart{part_json.value("id", ""), tool_output_from_json(part_json.value("tool_result", json::object()))});
      } else if (type == "tool_confirmation_request") {
        std::optional<std::string> prompt;
        if (part_json.contains("prompt")) {
          prompt = part_json["prompt"].get<std::string>();
        }
        msg.parts_.push_back(ToolConfirmationRequestPart{part_json.value("id", ""), part_json.value("tool_name", ""),
                                                         part_json.value("arguments", json::object()), prompt});
      } else if (type == "frontend_tool_request") {
        msg.parts_.push_back(
            FrontendToolRequestPart{part_json.value("id", ""), tool_call_result_from_json(part_json.value("tool_call", json::object()))});
      }
    }
  }

  return msg;
}

}  // namespace converse
