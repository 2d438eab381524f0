#include "agent/prompt_manager.hpp"

#include <sstream>

namespace converse {

namespace {

constexpr const char* kBasePrompt =
    "You are a general-purpose AI agent. You help the user complete tasks by reasoning about them "
    "and calling the tools provided by the enabled extensions.\n\n"
    "Extensions add capabilities to the agent. Call platform__search_available_extensions to find more "
    "extensions and platform__enable_extension to enable one when the current tools are not enough.\n\n"
    "{{extensions}}";

std::string render_extensions(const std::vector<ExtensionInfo>& extensions,
                              const std::optional<std::string>& frontend_instructions) {
  std::ostringstream out;

  if (extensions.empty() && !frontend_instructions) {
    out << "No extensions are defined. You should let the user know that they should add extensions.";
    return out.str();
  }

  out << "# Extensions\n";
  for (const auto& ext : extensions) {
    out << "\n## " << ext.name << "\n";
    if (ext.has_resources) {
      out << ext.name << " supports resources, you can use platform__read_resource and "
          << "platform__list_resources on this extension.\n";
    }
    if (!ext.instructions.empty()) {
      out << "### Instructions\n" << ext.instructions << "\n";
    }
  }

  if (frontend_instructions) {
    out << "\n## frontend\n### Instructions\n" << *frontend_instructions << "\n";
  }

  return out.str();
}

void replace_all(std::string& text, const std::string& from, const std::string& to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

}  // namespace

void PromptManager::add_system_prompt_extra(const std::string& instruction) {
  extras_.push_back(instruction);
}

void PromptManager::set_system_prompt_override(const std::string& tmpl) {
  override_ = tmpl;
}

std::string PromptManager::build_system_prompt(const std::vector<ExtensionInfo>& extensions,
                                               const std::optional<std::string>& frontend_instructions) const {
  std::string prompt = override_.value_or(kBasePrompt);
  replace_all(prompt, "{{extensions}}", render_extensions(extensions, frontend_instructions));

  if (!extras_.empty()) {
    prompt += "\n\n# Additional Instructions:\n\n";
    for (size_t i = 0; i < extras_.size(); ++i) {
      if (i > 0) prompt += "\n\n";
      prompt += extras_[i];
    }
  }

  return prompt;
}

}  // namespace converse
