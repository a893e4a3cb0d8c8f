#include "ragdesk_core/tools/tool_registry.hpp"

namespace ragdesk_core {

void ToolRegistry::register_tool(Tool tool) {
  if (tool.name.empty()) {
    throw ToolError("Tool name cannot be empty");
  }
  if (!tool.invoke) {
    throw ToolError("Tool '" + tool.name + "' has no callable");
  }
  if (find(tool.name) != nullptr) {
    throw ToolError("Tool already registered: " + tool.name);
  }
  tools_.push_back(std::move(tool));
}

const Tool *ToolRegistry::find(const std::string &name) const {
  for (const auto &tool : tools_) {
    if (tool.name == name) {
      return &tool;
    }
  }
  return nullptr;
}

std::string ToolRegistry::invoke(const std::string &name, const std::string &query) const {
  const Tool *tool = find(name);
  if (tool == nullptr) {
    throw ToolNotFoundError("Unknown tool: " + name);
  }
  return tool->invoke(query);
}

}  // namespace ragdesk_core
