#pragma once

#include <string>

#include "tool/tool.hpp"

namespace converse {

// Tools served by the engine itself rather than an extension
namespace platform_tools {

constexpr const char* kReadResource = "platform__read_resource";
constexpr const char* kListResources = "platform__list_resources";
constexpr const char* kSearchAvailableExtensions = "platform__search_available_extensions";
constexpr const char* kEnableExtension = "platform__enable_extension";

Tool read_resource_tool();
Tool list_resources_tool();
Tool search_available_extensions_tool();
Tool enable_extension_tool();

// True for any "platform__" tool; these bypass permission checks
bool is_platform_tool(const std::string& name);

}  // namespace platform_tools

}  // namespace converse
