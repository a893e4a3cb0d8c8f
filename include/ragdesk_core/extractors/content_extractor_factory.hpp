#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "content_extractor.hpp"

/**
 * @class ContentExtractorFactory
 * @brief Manages and provides the correct ContentExtractor for a given file type.
 *
 * Holds one extractor per supported format and selects it by file extension.
 * There is no fallback extractor: unknown extensions are rejected so callers
 * can fail before doing any chunking or embedding work.
 */
namespace ragdesk_core {
class ContentExtractorFactory {
 public:
  /**
   * @brief Constructs the factory and registers the plain text and PDF extractors.
   */
  ContentExtractorFactory();
  virtual ~ContentExtractorFactory() = default;

  /**
   * @brief Returns the extractor registered for the file's extension.
   *
   * @param file_path The path to the file that needs to be processed.
   * @return A constant reference to the appropriate ContentExtractor.
   * @throw UnsupportedFormatError if no extractor handles the extension.
   */
  virtual const ContentExtractor& get_extractor_for(const std::filesystem::path& file_path) const;

  // True if some registered extractor handles the file's extension
  virtual bool supports(const std::filesystem::path& file_path) const;

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory(ContentExtractorFactory&&) = delete;
  ContentExtractorFactory& operator=(ContentExtractorFactory&&) = delete;

 private:
  std::vector<ContentExtractorPtr> extractors;
};
}  // namespace ragdesk_core
