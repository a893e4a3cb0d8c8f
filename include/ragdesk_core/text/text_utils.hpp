#pragma once

#include <string>
#include <string_view>

namespace ragdesk_core::text {

// Same set as the C locale isspace: space, \t, \n, \v, \f, \r
bool is_space(char c);

// Removes leading and trailing whitespace
std::string trim(std::string_view text);

// ASCII lowercase copy; bytes outside ASCII are left untouched
std::string to_lower(std::string_view text);

// Number of code points in a UTF-8 string. Counts lead bytes only, so it never
// fails on malformed input.
size_t utf8_length(std::string_view text);

// Longest prefix of text holding at most max_chars code points. Never splits a
// multi-byte sequence.
std::string utf8_truncate(std::string_view text, size_t max_chars);

}  // namespace ragdesk_core::text
