#include "permission/permission.hpp"

#include "tool/platform_tools.hpp"

namespace converse {

std::string to_string(Permission permission) {
  switch (permission) {
    case Permission::AlwaysAllow:
      return "always_allow";
    case Permission::AllowOnce:
      return "allow_once";
    case Permission::DenyOnce:
      return "deny_once";
  }
  return "deny_once";
}

std::optional<Permission> permission_from_string(const std::string& str) {
  if (str == "always_allow") return Permission::AlwaysAllow;
  if (str == "allow_once") return Permission::AllowOnce;
  if (str == "deny_once") return Permission::DenyOnce;
  return std::nullopt;
}

void PermissionStore::set(const std::string& tool_name, PermissionLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  levels_[tool_name] = level;
}

std::optional<PermissionLevel> PermissionStore::get(const std::string& tool_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = levels_.find(tool_name);
  if (it == levels_.end()) return std::nullopt;
  return it->second;
}

void PermissionStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  levels_.clear();
}

PermissionCheckResult check_tool_permissions(const std::vector<ToolRequestPart>& requests, ExecutionMode mode,
                                             const std::set<std::string>& read_only_tools,
                                             const PermissionStore& store) {
  PermissionCheckResult result;

  for (const auto& request : requests) {
    if (!request.tool_call.ok() || mode == ExecutionMode::Auto || mode == ExecutionMode::Chat) {
      result.approved.push_back(request);
      continue;
    }

    const auto& name = request.tool_call.value->name;
    if (platform_tools::is_platform_tool(name)) {
      result.approved.push_back(request);
      continue;
    }

    auto level = store.get(name);
    if (level == PermissionLevel::NeverAllow) {
      result.denied.push_back(request);
    } else if (level == PermissionLevel::AlwaysAllow) {
      result.approved.push_back(request);
    } else if (mode == ExecutionMode::SmartApprove && level != PermissionLevel::AskBefore &&
               read_only_tools.count(name) > 0) {
      result.approved.push_back(request);
    } else {
      result.needs_approval.push_back(request);
    }
  }

  return result;
}

}  // namespace converse
