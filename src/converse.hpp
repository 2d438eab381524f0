#pragma once

// Core types
#include "core/config.hpp"
#include "core/content.hpp"
#include "core/message.hpp"
#include "core/types.hpp"
#include "core/uuid.hpp"

// Event bus
#include "bus/bus.hpp"

// Conversation model and context budget
#include "context/context_strategy.hpp"
#include "context/token_counter.hpp"
#include "conversation/conversation.hpp"

// LLM providers
#include "llm/model_config.hpp"
#include "llm/provider.hpp"
#include "llm/toolshim.hpp"

// Tools and extensions
#include "extension/extension.hpp"
#include "extension/extension_manager.hpp"
#include "tool/platform_tools.hpp"
#include "tool/tool.hpp"

// Permissions
#include "permission/permission.hpp"

// Session persistence
#include "session/session_log.hpp"

// Reply engine
#include "agent/agent.hpp"

#ifndef CONVERSE_VERSION_STRING
#define CONVERSE_VERSION_STRING "0.1.0"
#endif

namespace converse {

// Initialize logging from the config
void init(const EngineConfig& config = EngineConfig{});

// Flush and drop loggers
void shutdown();

// Get version string
std::string version();

}  // namespace converse
