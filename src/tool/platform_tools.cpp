#include "tool/platform_tools.hpp"

namespace converse::platform_tools {

Tool read_resource_tool() {
  auto tool = Tool::with_parameters(
      kReadResource,
      "Read a resource from an extension.\n\n"
      "Resources allow extensions to share data that provide context to the model, such as files, "
      "database schemas, or application-specific information. This tool searches for the resource URI "
      "in the provided extension, and reads in the resource content. If no extension is provided, the "
      "tool will search all extensions for the resource.",
      {
          {"uri", "string", "Resource URI", true, std::nullopt, std::nullopt},
          {"extension_name", "string", "Optional extension name", false, std::nullopt, std::nullopt},
      });
  tool.annotations = ToolAnnotations{true, false};
  return tool;
}

Tool list_resources_tool() {
  auto tool = Tool::with_parameters(
      kListResources,
      "List resources from an extension(s).\n\n"
      "Resources allow extensions to share data that provide context to the model. If no extension_name "
      "is provided, the tool will search all extensions for resources.",
      {
          {"extension_name", "string", "Optional extension name", false, std::nullopt, std::nullopt},
      });
  tool.annotations = ToolAnnotations{true, false};
  return tool;
}

Tool search_available_extensions_tool() {
  auto tool = Tool::with_parameters(
      kSearchAvailableExtensions,
      "Searches for additional extensions available to help complete tasks.\n"
      "Use this tool when you're unable to find a specific feature or functionality you need to complete "
      "your task, or when standard approaches aren't working.",
      {});
  tool.annotations = ToolAnnotations{true, false};
  return tool;
}

Tool enable_extension_tool() {
  return Tool::with_parameters(
      kEnableExtension,
      "Enable extensions to help complete tasks.\n"
      "Enable an extension by providing the extension name. Use "
      "platform__search_available_extensions first to see what can be enabled.",
      {
          {"extension_name", "string", "The name of the extension to enable", true, std::nullopt, std::nullopt},
      });
}

bool is_platform_tool(const std::string& name) {
  return name.rfind("platform__", 0) == 0;
}

}  // namespace converse::platform_tools
