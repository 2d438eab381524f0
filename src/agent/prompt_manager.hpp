#pragma once

#include <optional>
#include <string>
#include <vector>

#include "extension/extension.hpp"

namespace converse {

// Assembles the system prompt from extension instructions and caller extras
class PromptManager {
 public:
  // Appended to the prompt under "# Additional Instructions"
  void add_system_prompt_extra(const std::string& instruction);

  // Replaces the base prompt; "{{extensions}}" expands to the extension sections
  void set_system_prompt_override(const std::string& tmpl);

  std::string build_system_prompt(const std::vector<ExtensionInfo>& extensions,
                                  const std::optional<std::string>& frontend_instructions) const;

 private:
  std::vector<std::string> extras_;
  std::optional<std::string> override_;
};

}  // namespace converse
