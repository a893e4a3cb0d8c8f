#pragma once

#include <memory>
#include <string>

#include "ragdesk_core/llm/http_transport.hpp"
#include "ragdesk_core/tools/tool_registry.hpp"

namespace ragdesk_core {

class WebSearchError : public std::exception {
 public:
  explicit WebSearchError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

enum class WebSearchMode { Simulated, Tavily };

struct WebSearchOptions {
  WebSearchMode mode = WebSearchMode::Simulated;
  std::string url = "https://api.tavily.com/search";
  std::string api_key;
  int max_results = 3;
};

/**
 * @class WebSearchTool
 * @brief Web search tool backed by the Tavily API or by canned results.
 *
 * Simulated mode returns results keyed on words in the query, formatted like
 * the live ones (numbered entries with a Source: URL), so tool selection can
 * be exercised offline. Tavily mode without an API key or transport falls
 * back to simulated mode with a warning.
 */
class WebSearchTool {
 public:
  static constexpr const char *kToolName = "search_web";
  static constexpr const char *kToolDescription =
      "Search the internet for current, up-to-date information. "
      "Use this when the question asks about recent events, news, "
      "latest developments, or information not in personal documents. "
      "Input should be a search query.";

  WebSearchTool() = default;
  WebSearchTool(WebSearchOptions options, std::shared_ptr<HttpTransport> transport);

  // Throws WebSearchError when a live search fails
  std::string search(const std::string &query) const;

  WebSearchMode mode() const {
    return options_.mode;
  }

  Tool as_tool() const;

 private:
  WebSearchOptions options_;
  std::shared_ptr<HttpTransport> transport_;

  std::string search_tavily(const std::string &query) const;
  static std::string search_simulated(const std::string &query);
};

}  // namespace ragdesk_core
