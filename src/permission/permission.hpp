#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/message.hpp"

namespace converse {

// Decision returned by a human or policy for one tool request
enum class Permission { AlwaysAllow, AllowOnce, DenyOnce };

std::string to_string(Permission permission);
std::optional<Permission> permission_from_string(const std::string& str);

struct PermissionConfirmation {
  Permission permission = Permission::DenyOnce;

  bool allowed() const {
    return permission == Permission::AlwaysAllow || permission == Permission::AllowOnce;
  }
};

// Stored per-tool preference
enum class PermissionLevel { AlwaysAllow, AskBefore, NeverAllow };

// Remembers per-tool decisions across replies
class PermissionStore {
 public:
  void set(const std::string& tool_name, PermissionLevel level);
  std::optional<PermissionLevel> get(const std::string& tool_name) const;
  void clear();

 private:
  mutable std::mutex mutex_;
  std::map<std::string, PermissionLevel> levels_;
};

struct PermissionCheckResult {
  std::vector<ToolRequestPart> approved;
  std::vector<ToolRequestPart> needs_approval;
  std::vector<ToolRequestPart> denied;
};

/**
 * Split standard tool requests by how they may run.
 *
 * auto approves everything; approve asks for anything not always-allowed;
 * smart_approve also approves tools annotated read-only. Platform tools and
 * requests whose tool call failed to parse are always approved.
 */
PermissionCheckResult check_tool_permissions(const std::vector<ToolRequestPart>& requests, ExecutionMode mode,
                                             const std::set<std::string>& read_only_tools,
                                             const PermissionStore& store);

}  // namespace converse
