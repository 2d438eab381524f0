#include "extension/extension_manager.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace converse {

LocalExtensionManager::LocalExtensionManager(size_t dispatch_threads) : pool_(dispatch_threads == 0 ? 1 : dispatch_threads) {}

LocalExtensionManager::~LocalExtensionManager() {
  pool_.join();
}

void LocalExtensionManager::add_extension(std::shared_ptr<Extension> extension) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto name = extension->name();
  spdlog::info("[Extensions] Enabled {}", name);
  extensions_[name] = std::move(extension);
}

void LocalExtensionManager::register_available(const std::string& name, const std::string& description, Factory factory) {
  std::lock_guard<std::mutex> lock(mutex_);
  catalog_[name] = Available{description, std::move(factory)};
}

std::shared_ptr<Extension> LocalExtensionManager::find(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = extensions_.find(name);
  return it != extensions_.end() ? it->second : nullptr;
}

std::future<ToolOutput> LocalExtensionManager::ready(ToolOutput output) {
  std::promise<ToolOutput> promise;
  promise.set_value(std::move(output));
  return promise.get_future();
}

std::future<ToolOutput> LocalExtensionManager::submit(std::function<ToolOutput()> fn) {
  auto promise = std::make_shared<std::promise<ToolOutput>>();
  auto future = promise->get_future();

  asio::post(pool_, [promise, fn = std::move(fn)]() {
    try {
      promise->set_value(fn());
    } catch (const std::exception& e) {
      promise->set_value(ToolOutput::failure(ToolError::execution(e.what())));
    }
  });

  return future;
}

Result<std::vector<Tool>> LocalExtensionManager::get_prefixed_tools() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Tool> tools;

  for (const auto& [name, extension] : extensions_) {
    for (auto tool : extension->tools()) {
      tool.name = name + kToolPrefixSeparator + tool.name;
      tools.push_back(std::move(tool));
    }
  }

  return Result<std::vector<Tool>>::success(std::move(tools));
}

std::future<ToolOutput> LocalExtensionManager::dispatch_tool_call(const ToolCall& call) {
  auto pos = call.name.find(kToolPrefixSeparator);
  if (pos == std::string::npos) {
    return ready(ToolOutput::failure(ToolError::not_found(call.name)));
  }

  auto extension_name = call.name.substr(0, pos);
  auto tool_name = call.name.substr(pos + 2);

  auto extension = find(extension_name);
  if (!extension) {
    return ready(ToolOutput::failure(ToolError::not_found(call.name)));
  }

  std::optional<Tool> tool;
  for (auto& t : extension->tools()) {
    if (t.name == tool_name) {
      tool = std::move(t);
      break;
    }
  }
  if (!tool) {
    return ready(ToolOutput::failure(ToolError::not_found(call.name)));
  }

  auto validated = tool->validate_args(call.arguments);
  if (!validated.ok()) {
    return ready(ToolOutput::failure(ToolError::invalid_parameters(validated.error.value_or(""))));
  }

  spdlog::debug("[Extensions] Dispatching {} to {}", tool_name, extension_name);
  auto arguments = call.arguments;
  return submit([extension, tool_name, arguments]() {
    return extension->call_tool(tool_name, arguments);
  });
}

std::future<ToolOutput> LocalExtensionManager::read_resource(const json& arguments) {
  auto uri = arguments.value("uri", "");
  if (uri.empty()) {
    return ready(ToolOutput::failure(ToolError::invalid_parameters("Missing 'uri' parameter")));
  }
  auto extension_name = arguments.value("extension_name", "");

  std::vector<std::shared_ptr<Extension>> candidates;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [name, extension] : extensions_) {
      if (extension->supports_resources() && (extension_name.empty() || extension_name == name)) {
        candidates.push_back(extension);
      }
    }
  }

  return submit([candidates, uri]() {
    for (const auto& extension : candidates) {
      auto content = extension->read_resource(uri);
      if (content.ok()) {
        return ToolOutput::success({text_content(*content.value)});
      }
    }
    return ToolOutput::failure(ToolError::invalid_parameters("Resource with uri '" + uri + "' not found"));
  });
}

std::future<ToolOutput> LocalExtensionManager::list_resources(const json& arguments) {
  auto extension_name = arguments.value("extension_name", "");

  std::ostringstream out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!extension_name.empty() && extensions_.find(extension_name) == extensions_.end()) {
      return ready(ToolOutput::failure(ToolError::invalid_parameters("Extension '" + extension_name + "' not found")));
    }

    for (const auto& [name, extension] : extensions_) {
      if (!extension->supports_resources() || (!extension_name.empty() && extension_name != name)) {
        continue;
      }
      for (const auto& resource : extension->list_resources()) {
        out << name << ": " << resource.name << " (" << resource.uri << ")\n";
      }
    }
  }

  return ready(ToolOutput::success({text_content(out.str())}));
}

std::future<ToolOutput> LocalExtensionManager::search_available_extensions() {
  std::ostringstream out;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    out << "Extensions available to enable:\n";
    for (const auto& [name, entry] : catalog_) {
      if (extensions_.find(name) == extensions_.end()) {
        out << "- " << name << ": " << entry.description << "\n";
      }
    }

    out << "\nExtensions already enabled:\n";
    for (const auto& [name, extension] : extensions_) {
      out << "- " << name << "\n";
    }
  }

  return ready(ToolOutput::success({text_content(out.str())}));
}

std::vector<ExtensionInfo> LocalExtensionManager::get_extensions_info() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ExtensionInfo> infos;
  for (const auto& [name, extension] : extensions_) {
    infos.push_back({name, extension->instructions(), extension->supports_resources()});
  }
  return infos;
}

bool LocalExtensionManager::supports_resources() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [name, extension] : extensions_) {
    if (extension->supports_resources()) return true;
  }
  return false;
}

Result<std::vector<ResourceItem>> LocalExtensionManager::get_resources() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ResourceItem> items;

  for (const auto& [name, extension] : extensions_) {
    if (!extension->supports_resources()) continue;

    for (const auto& resource : extension->list_resources()) {
      auto content = extension->read_resource(resource.uri);
      if (!content.ok()) {
        spdlog::warn("[Extensions] Cannot read {} from {}: {}", resource.uri, name,
                     content.error ? content.error->to_string() : "unknown error");
        continue;
      }
      items.push_back({name, resource.uri, resource.name, *content.value, resource.timestamp, resource.priority});
    }
  }

  return Result<std::vector<ResourceItem>>::success(std::move(items));
}

Result<std::string> LocalExtensionManager::enable_extension(const std::string& name) {
  Factory factory;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (extensions_.find(name) != extensions_.end()) {
      return Result<std::string>::success("The extension '" + name + "' is already enabled");
    }
    auto it = catalog_.find(name);
    if (it == catalog_.end()) {
      return Result<std::string>::failure("Extension '" + name +
                                          "' not found. Please check the extension name and try again.");
    }
    factory = it->second.factory;
  }

  std::shared_ptr<Extension> extension;
  try {
    extension = factory();
  } catch (const std::exception& e) {
    return Result<std::string>::failure("Failed to start extension '" + name + "': " + e.what());
  }
  if (!extension) {
    return Result<std::string>::failure("Failed to start extension '" + name + "'");
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    extensions_[name] = std::move(extension);
  }
  spdlog::info("[Extensions] Enabled {} from catalog", name);
  return Result<std::string>::success("The extension '" + name + "' has been installed successfully");
}

bool LocalExtensionManager::disable_extension(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto removed = extensions_.erase(name) > 0;
  if (removed) {
    spdlog::info("[Extensions] Disabled {}", name);
  }
  return removed;
}

std::vector<std::string> LocalExtensionManager::list_extensions() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  for (const auto& [name, extension] : extensions_) {
    names.push_back(name);
  }
  return names;
}

}  // namespace converse
