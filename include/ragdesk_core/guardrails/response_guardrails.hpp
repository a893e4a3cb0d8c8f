#pragma once

#include <string>
#include <vector>

namespace ragdesk_core {

struct SourceVerification {
  bool has_sources = false;
  std::vector<std::string> cited_tools;
  double confidence = 0.0;
};

struct UncertaintyCheck {
  bool is_uncertain = false;
  bool should_ask_clarification = false;
};

/**
 * @class ResponseGuardrails
 * @brief String checks applied to an answer before it is shown to the user.
 *
 * Flags answers that do not say where their information came from and
 * answers that hedge. None of the checks call out to a model.
 */
class ResponseGuardrails {
 public:
  static constexpr double kCitedConfidence = 0.9;
  static constexpr double kUncitedConfidence = 0.7;
  static constexpr double kNoToolsConfidence = 0.5;

  SourceVerification verify_sources(const std::string &answer,
                                    const std::vector<std::string> &tools_used) const;

  UncertaintyCheck detect_uncertainty(const std::string &answer) const;

  // Appends a sources note when tools were used but the answer cites nothing
  std::string enhance_response(const std::string &answer,
                               const std::vector<std::string> &tools_used) const;

  // "your documents" for search_documents, "web search" for search_web, the name otherwise
  static std::string friendly_label(const std::string &tool_name);
};

}  // namespace ragdesk_core
