#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "ragdesk_core/types/file.hpp"

namespace fs = std::filesystem;

namespace ragdesk_core {

class ContentExtractorError : public std::exception {
 public:
  explicit ContentExtractorError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// The file extension is neither plain text nor a paginated document
class UnsupportedFormatError : public ContentExtractorError {
 public:
  using ContentExtractorError::ContentExtractorError;
};

// The file's bytes are not valid UTF-8
class DecodeError : public ContentExtractorError {
 public:
  using ContentExtractorError::ContentExtractorError;
};

class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  // Opens the file and returns its full text content
  virtual std::string extract_text(const fs::path& file_path) const = 0;

  virtual FileType get_file_type() const = 0;

 protected:
  // Reads the raw bytes of the file
  std::string get_string_content(const fs::path& file_path) const;
  static std::string lowercase_extension(const fs::path& file_path);
};

// Define a type for our smart pointers
using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace ragdesk_core
