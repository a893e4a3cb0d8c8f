#include "ragdesk_core/routing/query_router.hpp"

#include <array>

#include "ragdesk_core/services/retrieval_service.hpp"
#include "ragdesk_core/text/text_utils.hpp"
#include "ragdesk_core/tools/web_search_tool.hpp"

namespace ragdesk_core {

namespace {

constexpr std::array<const char *, 9> kPersonalCues = {
    "my ", "notes", "note ", "document", "i wrote", "saved", "personal", "i read", "i learned"};

constexpr std::array<const char *, 8> kRecencyCues = {
    "latest", "news", "recent", "current", "today", "this week", "this year", "update"};

}  // namespace

std::string to_string(Route route) {
  switch (route) {
    case Route::Documents:
      return "documents";
    case Route::Web:
      return "web";
    case Route::Both:
      return "both";
    case Route::None:
      return "none";
  }
  return "none";
}

RouteDecision QueryRouter::classify(const std::string &question) const {
  // Padding lets cues with a trailing space match at the end of the question
  const std::string q = text::to_lower(question) + " ";

  RouteDecision decision;
  bool personal = false;
  bool recent = false;
  for (const char *cue : kPersonalCues) {
    if (q.find(cue) != std::string::npos) {
      personal = true;
      decision.reasons.push_back(std::string("personal cue '") + cue + "'");
    }
  }
  for (const char *cue : kRecencyCues) {
    if (q.find(cue) != std::string::npos) {
      recent = true;
      decision.reasons.push_back(std::string("recency cue '") + cue + "'");
    }
  }

  if (personal && recent) {
    decision.route = Route::Both;
  } else if (personal) {
    decision.route = Route::Documents;
  } else if (recent) {
    decision.route = Route::Web;
  }
  return decision;
}

std::vector<std::string> QueryRouter::tools_for(Route route) {
  switch (route) {
    case Route::Documents:
      return {RetrievalService::kToolName};
    case Route::Web:
      return {WebSearchTool::kToolName};
    case Route::Both:
      return {RetrievalService::kToolName, WebSearchTool::kToolName};
    case Route::None:
      break;
  }
  return {};
}

}  // namespace ragdesk_core
