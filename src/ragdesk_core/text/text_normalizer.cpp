#include "ragdesk_core/text/text_normalizer.hpp"

#include <algorithm>

#include "ragdesk_core/text/text_utils.hpp"

namespace ragdesk_core::text {

std::string normalize(std::string_view text) {
  std::string collapsed;
  collapsed.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    const char c = text[i];
    if (c != '\n' && c != ' ') {
      collapsed.push_back(c);
      ++i;
      continue;
    }
    size_t run_end = i;
    while (run_end < text.size() && text[run_end] == c)
      ++run_end;
    // Paragraph breaks survive as a blank line, spaces collapse to one
    const size_t keep = c == '\n' ? std::min<size_t>(run_end - i, 2) : 1;
    collapsed.append(keep, c);
    i = run_end;
  }

  return trim(collapsed);
}

}  // namespace ragdesk_core::text
