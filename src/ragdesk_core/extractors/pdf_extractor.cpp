#include "ragdesk_core/extractors/pdf_extractor.hpp"

#include <poppler-document.h>
#include <poppler-page.h>

#include <memory>

#include "ragdesk_core/text/text_utils.hpp"

namespace ragdesk_core {

bool PdfExtractor::can_handle(const fs::path& file_path) const {
  return lowercase_extension(file_path) == ".pdf";
}

std::string PdfExtractor::extract_text(const fs::path& file_path) const {
  if (!fs::is_regular_file(file_path)) {
    throw ContentExtractorError("Could not open file: " + file_path.string());
  }

  std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(file_path.string()));
  if (!doc) {
    throw ContentExtractorError("Failed to load PDF document: " + file_path.string());
  }
  // Reject encrypted/locked PDFs
  if (doc->is_locked()) {
    throw ContentExtractorError("PDF is encrypted or password-protected: " + file_path.string());
  }

  std::string full_text;
  const int page_count = doc->pages();
  for (int i = 0; i < page_count; ++i) {
    std::unique_ptr<poppler::page> page(doc->create_page(i));
    if (!page) {
      continue;
    }

    const poppler::byte_array utf8_page = page->text().to_utf8();
    std::string page_text(utf8_page.begin(), utf8_page.end());
    if (text::trim(page_text).empty()) {
      continue;
    }

    if (!full_text.empty()) {
      full_text.push_back('\n');
    }
    full_text += page_text;
  }
  return full_text;
}

}  // namespace ragdesk_core
