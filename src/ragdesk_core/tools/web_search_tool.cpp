#include "ragdesk_core/tools/web_search_tool.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

#include "ragdesk_core/text/text_utils.hpp"

namespace ragdesk_core {

namespace {

bool contains(const std::string &haystack, const char *needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

WebSearchTool::WebSearchTool(WebSearchOptions options, std::shared_ptr<HttpTransport> transport)
    : options_(std::move(options)), transport_(std::move(transport)) {
  if (options_.mode == WebSearchMode::Tavily && (options_.api_key.empty() || !transport_)) {
    std::cerr << "[WebSearchTool] Tavily not available, falling back to simulated mode"
              << std::endl;
    options_.mode = WebSearchMode::Simulated;
  }
}

std::string WebSearchTool::search(const std::string &query) const {
  if (options_.mode == WebSearchMode::Tavily) {
    return search_tavily(query);
  }
  return search_simulated(query);
}

std::string WebSearchTool::search_tavily(const std::string &query) const {
  nlohmann::json request_data = {{"query", query}, {"max_results", options_.max_results}};
  const std::vector<std::string> headers = {"Authorization: Bearer " + options_.api_key};

  HttpResponse response;
  try {
    response = transport_->post_json(options_.url, headers, request_data.dump());
  } catch (const HttpTransportError &e) {
    throw WebSearchError("Web search request failed: " + std::string(e.what()));
  }
  if (response.status_code != 200) {
    throw WebSearchError("Web search failed with HTTP " + std::to_string(response.status_code) +
                         ": " + response.body);
  }

  std::string formatted = "Web Search Results:\n\n";
  try {
    auto json_response = nlohmann::json::parse(response.body);
    const auto results = json_response.value("results", nlohmann::json::array());
    int rank = 0;
    for (const auto &result : results) {
      if (rank == options_.max_results) {
        break;
      }
      ++rank;
      formatted += "[" + std::to_string(rank) + "] " + result.at("title").get<std::string>() + "\n";
      formatted += "    " + result.at("content").get<std::string>() + "\n";
      formatted += "    Source: " + result.at("url").get<std::string>() + "\n\n";
    }
  } catch (const nlohmann::json::exception &e) {
    throw WebSearchError("Malformed web search response: " + std::string(e.what()));
  }
  return formatted;
}

std::string WebSearchTool::search_simulated(const std::string &query) {
  const std::string q = text::to_lower(query);

  if (contains(q, "rag") || contains(q, "retrieval")) {
    return "Web Search Results:\n\n"
           "[1] Recent Advances in RAG Systems - AI Research Blog\n"
           "    Recent improvements in RAG include hybrid search (combining dense and sparse\n"
           "    retrieval), re-ranking strategies, and better chunking methods.\n"
           "    Source: https://airesearch.example.com/rag-advances\n\n"
           "[2] RAG vs Fine-tuning: When to Use Which - ML Journal\n"
           "    RAG is preferred when you need up-to-date information, source attribution, or\n"
           "    domain-specific knowledge without retraining.\n"
           "    Source: https://mljournal.example.com/rag-vs-finetuning\n\n"
           "[3] Production RAG at Scale - Tech Conference\n"
           "    Scaling RAG to millions of documents: exact search for small corpora,\n"
           "    approximate indexes beyond that, hybrid search for recall.\n"
           "    Source: https://techconf.example.com/rag-production\n";
  }

  if (contains(q, "news") || contains(q, "latest") || contains(q, "recent")) {
    return "Web Search Results:\n\n"
           "[1] Latest AI Developments This Week\n"
           "    Model providers shipped reasoning and tool-use improvements.\n"
           "    Source: https://ainews.example.com/weekly-update\n\n"
           "[2] AI Regulation Updates\n"
           "    Implementation of new AI rules begins, industry pushing for a balanced approach.\n"
           "    Source: https://airegulation.example.com/updates\n";
  }

  return "Web Search Results:\n\n"
         "[1] Information about: " + query + "\n"
         "    Current information from the web about " + query + ". This is a simulated result.\n"
         "    Source: https://example.com/search\n\n"
         "[2] More on " + query + "\n"
         "    Additional context and recent updates related to your query.\n"
         "    Source: https://example2.com/info\n";
}

Tool WebSearchTool::as_tool() const {
  WebSearchTool tool = *this;
  return Tool{kToolName, kToolDescription,
              [tool](const std::string &query) { return tool.search(query); }};
}

}  // namespace ragdesk_core
