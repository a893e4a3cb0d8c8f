#include "ragdesk_core/extractors/content_extractor_factory.hpp"

#include "ragdesk_core/extractors/pdf_extractor.hpp"
#include "ragdesk_core/extractors/plaintext_extractor.hpp"

namespace ragdesk_core {
ContentExtractorFactory::ContentExtractorFactory() {
  extractors.push_back(std::make_unique<PlainTextExtractor>());
  extractors.push_back(std::make_unique<PdfExtractor>());
}

const ContentExtractor& ContentExtractorFactory::get_extractor_for(
    const std::filesystem::path& file_path) const {
  for (const auto& extractor : extractors) {
    if (extractor->can_handle(file_path)) {
      return *extractor;
    }
  }
  const std::string extension = file_path.extension().string();
  throw UnsupportedFormatError("Unsupported file type: " +
                               (extension.empty() ? std::string("(none)") : extension) + " (" +
                               file_path.filename().string() + ")");
}

bool ContentExtractorFactory::supports(const std::filesystem::path& file_path) const {
  for (const auto& extractor : extractors) {
    if (extractor->can_handle(file_path)) {
      return true;
    }
  }
  return false;
}
}  // namespace ragdesk_core
