#include "llm/provider.hpp"

namespace converse {

std::string to_string(ProviderError::Kind kind) {
  switch (kind) {
    case ProviderError::Kind::Authentication:
      return "Authentication error";
    case ProviderError::Kind::RateLimitExceeded:
      return "Rate limit exceeded";
    case ProviderError::Kind::ServerError:
      return "Server error";
    case ProviderError::Kind::ContextLengthExceeded:
      return "Context length exceeded";
    case ProviderError::Kind::RequestFailed:
      return "Request failed";
    case ProviderError::Kind::ExecutionError:
      return "Execution error";
    case ProviderError::Kind::UsageError:
      return "Usage data error";
    case ProviderError::Kind::ResponseParseError:
      return "Invalid response";
  }
  return "Request failed";
}

std::string ProviderError::to_string() const {
  return converse::to_string(kind) + ": " + message;
}

}  // namespace converse
