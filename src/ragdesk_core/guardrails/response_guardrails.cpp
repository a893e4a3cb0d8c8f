#include "ragdesk_core/guardrails/response_guardrails.hpp"

#include <array>

#include "ragdesk_core/text/text_utils.hpp"

namespace ragdesk_core {

namespace {

constexpr std::array<const char *, 4> kToolMentions = {"documents", "web", "search", "notes"};

constexpr std::array<const char *, 9> kUncertaintyPhrases = {
    "not sure",  "don't know", "cannot find",   "unclear",        "uncertain",
    "unable to", "don't have", "couldn't find", "no information"};

template <size_t N>
bool contains_any(const std::string &haystack, const std::array<const char *, N> &needles) {
  for (const char *needle : needles) {
    if (haystack.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace

SourceVerification ResponseGuardrails::verify_sources(
    const std::string &answer, const std::vector<std::string> &tools_used) const {
  const bool has_url =
      answer.find("http") != std::string::npos || answer.find("Source:") != std::string::npos;
  const bool has_tool_mention = contains_any(text::to_lower(answer), kToolMentions);

  SourceVerification result;
  result.has_sources = has_url || has_tool_mention;
  result.cited_tools = tools_used;
  if (tools_used.empty()) {
    result.confidence = kNoToolsConfidence;
  } else if (result.has_sources) {
    result.confidence = kCitedConfidence;
  } else {
    result.confidence = kUncitedConfidence;
  }
  return result;
}

UncertaintyCheck ResponseGuardrails::detect_uncertainty(const std::string &answer) const {
  const bool uncertain = contains_any(text::to_lower(answer), kUncertaintyPhrases);
  return {.is_uncertain = uncertain, .should_ask_clarification = uncertain};
}

std::string ResponseGuardrails::enhance_response(
    const std::string &answer, const std::vector<std::string> &tools_used) const {
  if (tools_used.empty() || verify_sources(answer, tools_used).has_sources) {
    return answer;
  }

  std::string labels;
  for (const auto &tool : tools_used) {
    if (!labels.empty()) {
      labels += ", ";
    }
    labels += friendly_label(tool);
  }
  return answer + "\n\n*Sources: " + labels + "*";
}

std::string ResponseGuardrails::friendly_label(const std::string &tool_name) {
  if (tool_name == "search_documents") {
    return "your documents";
  }
  if (tool_name == "search_web") {
    return "web search";
  }
  return tool_name;
}

}  // namespace ragdesk_core
