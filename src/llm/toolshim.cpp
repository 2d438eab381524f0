#include "llm/toolshim.hpp"

#include <spdlog/spdlog.h>

#include <set>
#include <sstream>

#include "core/uuid.hpp"

namespace converse {

namespace {

// Fenced ``` blocks, with or without a language tag
std::vector<std::string> fenced_blocks(const std::string& text) {
  std::vector<std::string> blocks;
  size_t pos = 0;
  while ((pos = text.find("```", pos)) != std::string::npos) {
    size_t body = text.find('\n', pos + 3);
    if (body == std::string::npos) break;
    size_t end = text.find("```", body + 1);
    if (end == std::string::npos) break;
    blocks.push_back(text.substr(body + 1, end - body - 1));
    pos = end + 3;
  }
  return blocks;
}

// Balanced top-level {...} spans, skipping braces inside strings
std::vector<std::string> bare_objects(const std::string& text) {
  std::vector<std::string> objects;
  int depth = 0;
  size_t start = 0;
  bool in_string = false;
  bool escaped = false;

  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }

    if (c == '"' && depth > 0) {
      in_string = true;
    } else if (c == '{') {
      if (depth == 0) start = i;
      ++depth;
    } else if (c == '}' && depth > 0) {
      if (--depth == 0) {
        objects.push_back(text.substr(start, i - start + 1));
      }
    }
  }
  return objects;
}

void collect_calls(const json& value, const std::set<std::string>& known, std::vector<ToolCall>& calls) {
  if (value.is_array()) {
    for (const auto& item : value) {
      collect_calls(item, known, calls);
    }
    return;
  }
  if (!value.is_object()) return;

  std::string name;
  json arguments = json::object();
  if (value.contains("name") && value["name"].is_string()) {
    name = value["name"].get<std::string>();
    if (value.contains("arguments")) arguments = value["arguments"];
  } else if (value.contains("tool") && value["tool"].is_string()) {
    name = value["tool"].get<std::string>();
    if (value.contains("args")) arguments = value["args"];
  } else {
    return;
  }

  if (known.count(name) == 0) {
    spdlog::debug("[Toolshim] Ignoring unknown tool {}", name);
    return;
  }
  if (!arguments.is_object()) {
    arguments = json::object();
  }
  calls.push_back(ToolCall{name, arguments});
}

}  // namespace

std::string modify_system_prompt_for_tool_json(const std::string& system_prompt, const std::vector<Tool>& tools) {
  std::ostringstream out;
  out << system_prompt << "\n\n";
  out << "## Tool Calling\n\n";
  out << "You cannot call tools natively. When a tool is needed, respond with a JSON object on its own, "
      << "in the form:\n\n"
      << "```json\n{\"name\": \"<tool_name>\", \"arguments\": {<parameters>}}\n```\n\n"
      << "Use one object per tool call. Only call the tools listed below.\n\n";
  out << "### Available Tools\n";
  for (const auto& tool : tools) {
    out << "\n- " << tool.name << ": " << tool.description << "\n";
    out << "  Parameters: " << tool.input_schema.dump() << "\n";
  }
  return out.str();
}

Result<std::vector<ToolCall>> JsonToolInterpreter::interpret_to_tool_calls(const std::string& text,
                                                                           const std::vector<Tool>& tools) {
  std::set<std::string> known;
  for (const auto& tool : tools) {
    known.insert(tool.name);
  }

  auto candidates = fenced_blocks(text);
  if (candidates.empty()) {
    candidates = bare_objects(text);
  }

  std::vector<ToolCall> calls;
  for (const auto& candidate : candidates) {
    auto parsed = json::parse(candidate, nullptr, false);
    if (parsed.is_discarded()) {
      continue;
    }
    collect_calls(parsed, known, calls);
  }

  return Result<std::vector<ToolCall>>::success(std::move(calls));
}

Result<Message> augment_message_with_tool_calls(ToolInterpreter& interpreter, Message message,
                                                const std::vector<Tool>& tools) {
  if (message.has_tool_request()) {
    return Result<Message>::success(std::move(message));
  }

  auto text = message.text();
  if (text.empty()) {
    return Result<Message>::success(std::move(message));
  }

  auto calls = interpreter.interpret_to_tool_calls(text, tools);
  if (!calls.ok()) {
    return Result<Message>::failure(calls.error.value_or("interpreter returned no result"));
  }

  for (auto& call : *calls.value) {
    spdlog::debug("[Toolshim] Interpreted tool call {}", call.name);
    message.add_tool_request(UUID::short_id("toolshim"), ToolCallResult::success(std::move(call)));
  }

  return Result<Message>::success(std::move(message));
}

}  // namespace converse
