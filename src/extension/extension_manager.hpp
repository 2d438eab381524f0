#pragma once

#include <asio.hpp>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/content.hpp"
#include "core/types.hpp"
#include "extension/extension.hpp"
#include "tool/tool.hpp"

namespace converse {

// Separator between extension and tool name in prefixed tool names
constexpr const char* kToolPrefixSeparator = "__";

// Tool catalog and dispatch surface used by the reply engine
class ExtensionManager {
 public:
  virtual ~ExtensionManager() = default;

  // Tools of all enabled extensions, named "<extension>__<tool>"
  virtual Result<std::vector<Tool>> get_prefixed_tools() = 0;

  virtual std::future<ToolOutput> dispatch_tool_call(const ToolCall& call) = 0;

  // {"uri": ..., "extension_name": optional}
  virtual std::future<ToolOutput> read_resource(const json& arguments) = 0;

  // {"extension_name": optional}
  virtual std::future<ToolOutput> list_resources(const json& arguments) = 0;

  virtual std::future<ToolOutput> search_available_extensions() = 0;

  virtual std::vector<ExtensionInfo> get_extensions_info() = 0;

  virtual bool supports_resources() = 0;

  // Contents of every resource of every enabled extension
  virtual Result<std::vector<ResourceItem>> get_resources() = 0;

  // Changes are visible to the next get_prefixed_tools()
  virtual Result<std::string> enable_extension(const std::string& name) = 0;
  virtual bool disable_extension(const std::string& name) = 0;

  virtual std::vector<std::string> list_extensions() = 0;
};

// Hosts in-process extensions and runs their tools on a thread pool
class LocalExtensionManager : public ExtensionManager {
 public:
  using Factory = std::function<std::shared_ptr<Extension>()>;

  explicit LocalExtensionManager(size_t dispatch_threads = 4);
  ~LocalExtensionManager() override;

  LocalExtensionManager(const LocalExtensionManager&) = delete;
  LocalExtensionManager& operator=(const LocalExtensionManager&) = delete;

  // Enable an extension right away
  void add_extension(std::shared_ptr<Extension> extension);

  // Make an extension discoverable through search / enable
  void register_available(const std::string& name, const std::string& description, Factory factory);

  Result<std::vector<Tool>> get_prefixed_tools() override;
  std::future<ToolOutput> dispatch_tool_call(const ToolCall& call) override;
  std::future<ToolOutput> read_resource(const json& arguments) override;
  std::future<ToolOutput> list_resources(const json& arguments) override;
  std::future<ToolOutput> search_available_extensions() override;
  std::vector<ExtensionInfo> get_extensions_info() override;
  bool supports_resources() override;
  Result<std::vector<ResourceItem>> get_resources() override;
  Result<std::string> enable_extension(const std::string& name) override;
  bool disable_extension(const std::string& name) override;
  std::vector<std::string> list_extensions() override;

 private:
  struct Available {
    std::string description;
    Factory factory;
  };

  std::shared_ptr<Extension> find(const std::string& name) const;

  // Runs fn on the pool; exceptions become ExecutionError
  std::future<ToolOutput> submit(std::function<ToolOutput()> fn);

  static std::future<ToolOutput> ready(ToolOutput output);

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Extension>> extensions_;
  std::map<std::string, Available> catalog_;
  asio::thread_pool pool_;
};

}  // namespace converse
