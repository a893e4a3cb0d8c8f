#pragma once

#include <functional>
#include <string>
#include <vector>

namespace ragdesk_core {

class ToolError : public std::exception {
 public:
  explicit ToolError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class ToolNotFoundError : public ToolError {
 public:
  using ToolError::ToolError;
};

// A named text-in/text-out capability. The description is what an
// orchestrator reads to decide when to call it.
struct Tool {
  std::string name;
  std::string description;
  std::function<std::string(const std::string &query)> invoke;
};

class ToolRegistry {
 public:
  // Throws ToolError on an empty name, a missing callback or a duplicate name
  void register_tool(Tool tool);

  // nullptr when no tool has that name
  const Tool *find(const std::string &name) const;

  // Throws ToolNotFoundError for unknown names
  std::string invoke(const std::string &name, const std::string &query) const;

  // In registration order
  const std::vector<Tool> &list() const {
    return tools_;
  }

  size_t size() const {
    return tools_.size();
  }

 private:
  std::vector<Tool> tools_;
};

}  // namespace ragdesk_core
