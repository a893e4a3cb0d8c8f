#pragma once

#include <string>
#include <vector>

namespace ragdesk_core {

enum class Route { Documents, Web, Both, None };

std::string to_string(Route route);

struct RouteDecision {
  Route route = Route::None;
  // The cues that matched, in the order they were checked
  std::vector<std::string> reasons;
};

/**
 * @class QueryRouter
 * @brief Decides which tools a question needs from keyword cues.
 *
 * Personal cues ("my ", "notes", "i wrote", ...) point at the user's
 * documents, recency cues ("latest", "news", "today", ...) point at the web.
 * Matching is case-insensitive substring search.
 */
class QueryRouter {
 public:
  RouteDecision classify(const std::string &question) const;

  // Tool names to call for a route, documents first
  static std::vector<std::string> tools_for(Route route);
};

}  // namespace ragdesk_core
