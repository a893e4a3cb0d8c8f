#include "ragdesk_core/extractors/content_extractor.hpp"

#include <fstream>
#include <sstream>

#include "ragdesk_core/text/text_utils.hpp"

namespace ragdesk_core {

std::string ContentExtractor::get_string_content(const fs::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw ContentExtractorError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw ContentExtractorError("Failed while reading file: " + file_path.string());
  }
  return buffer.str();
}

std::string ContentExtractor::lowercase_extension(const fs::path& file_path) {
  return text::to_lower(file_path.extension().string());
}

}  // namespace ragdesk_core
