#pragma once

#include <string>
#include <string_view>

namespace ragdesk_core::text {

/**
 * @brief Canonicalizes whitespace in extracted document text.
 *
 * Runs of three or more newlines become exactly two, runs of two or more
 * spaces become one, and leading/trailing whitespace is stripped.
 * normalize(normalize(x)) == normalize(x) for every input.
 */
std::string normalize(std::string_view text);

}  // namespace ragdesk_core::text
