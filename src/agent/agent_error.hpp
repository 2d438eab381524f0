#pragma once

#include <stdexcept>
#include <string>

namespace converse {

// Hard failure of a reply that cannot be expressed as conversation content
class AgentError : public std::runtime_error {
 public:
  enum class Kind {
    ContextLimit,  // history cannot be fit into the context budget
    Extension,     // the extension catalog is unavailable
    Invariant      // internal state that should be unreachable
  };

  AgentError(Kind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}

  Kind kind() const {
    return kind_;
  }

 private:
  Kind kind_;
};

}  // namespace converse
