#include "ragdesk_core/extractors/plaintext_extractor.hpp"

#include <utf8.h>

namespace ragdesk_core {

bool PlainTextExtractor::can_handle(const fs::path& file_path) const {
  return lowercase_extension(file_path) == ".txt";
}

namespace {

// "\r\n" and lone "\r" become "\n"
std::string translate_line_endings(const std::string& content) {
  std::string translated;
  translated.reserve(content.size());
  for (size_t i = 0; i < content.size(); ++i) {
    if (content[i] != '\r') {
      translated.push_back(content[i]);
      continue;
    }
    translated.push_back('\n');
    if (i + 1 < content.size() && content[i + 1] == '\n') {
      ++i;
    }
  }
  return translated;
}

}  // namespace

/**
 * @brief Reads the whole file, checks that it is valid UTF-8 and converts
 * Windows and old Mac line endings to "\n".
 *
 * @throw DecodeError naming the byte offset of the first invalid sequence.
 */
std::string PlainTextExtractor::extract_text(const fs::path& file_path) const {
  std::string content = get_string_content(file_path);

  auto invalid = utf8::find_invalid(content.begin(), content.end());
  if (invalid != content.end()) {
    throw DecodeError("Invalid UTF-8 in " + file_path.string() + " at byte offset " +
                      std::to_string(invalid - content.begin()));
  }
  return translate_line_endings(content);
}

}  // namespace ragdesk_core
