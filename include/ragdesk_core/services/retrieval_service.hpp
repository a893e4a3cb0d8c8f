#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "ragdesk_core/extractors/content_extractor_factory.hpp"
#include "ragdesk_core/index/vector_index.hpp"
#include "ragdesk_core/llm/embedding_client.hpp"
#include "ragdesk_core/text/chunker.hpp"
#include "ragdesk_core/tools/tool_registry.hpp"
#include "ragdesk_core/types/chunk.hpp"
#include "ragdesk_core/types/file.hpp"

namespace ragdesk_core {

enum class LoadPolicy { SkipFailed, FailFast };

struct RetrievalOptions {
  text::ChunkerOptions chunking;
  size_t default_top_k = 3;
  size_t excerpt_length = 300;
  LoadPolicy load_policy = LoadPolicy::SkipFailed;
};

struct LoadedDocument {
  std::string source_name;
  std::filesystem::path path;
  FileType file_type = FileType::Unknown;
  size_t chunk_count = 0;
};

struct FailedDocument {
  std::filesystem::path path;
  std::string reason;
};

struct LoadReport {
  std::vector<LoadedDocument> loaded;
  std::vector<FailedDocument> failed;
  size_t total_chunks = 0;

  bool has_failures() const {
    return !failed.empty();
  }
};

struct SearchResultEntry {
  size_t rank;  // 1 is the closest match
  float distance;
  int chunk_index;
  std::string source_name;
  std::string excerpt;
};

/**
 * @class RetrievalService
 * @brief Owns the loaded corpus: its chunks and the vector index over them.
 *
 * load_documents() runs extract -> normalize -> chunk -> embed -> index and
 * replaces the previous corpus as a whole. The chunk list and the index are
 * swapped in together, and only once both the embedding call and the index
 * build have succeeded, so a failed load leaves the old corpus searchable.
 *
 * Not thread-safe. Callers serialize access.
 */
class RetrievalService {
 public:
  static constexpr const char *kNoDocumentsMessage =
      "No documents loaded. Please upload documents first.";
  static constexpr const char *kToolName = "search_documents";
  static constexpr const char *kToolDescription =
      "Search through your personal documents and notes. "
      "Use this when the question is about YOUR information, past notes, "
      "saved documents, or personal knowledge. "
      "Input should be a search query.";

  RetrievalService(std::shared_ptr<EmbeddingClient> embedding_client,
                   std::shared_ptr<ContentExtractorFactory> extractor_factory,
                   RetrievalOptions options = {});

  /**
   * @brief Rebuilds the corpus from the given files.
   *
   * Every extension is checked before any file is read. Under
   * LoadPolicy::FailFast the first failure is rethrown; under SkipFailed
   * failures are logged and returned in the report.
   *
   * @throw UnsupportedFormatError, ContentExtractorError under FailFast.
   * @throw EmbeddingError (any policy) when the chunks cannot be embedded.
   */
  LoadReport load_documents(const std::vector<std::filesystem::path> &file_paths);

  // Nearest chunks for the query, closest first. Throws EmptyIndexError when nothing is loaded.
  std::vector<SearchResultEntry> search_chunks(const std::string &query, size_t k);

  // Formatted results, or kNoDocumentsMessage when nothing is loaded
  std::string search(const std::string &query, size_t k);
  std::string search(const std::string &query) {
    return search(query, options_.default_top_k);
  }

  // Formats entries as the text block returned by search()
  static std::string format_results(const std::vector<SearchResultEntry> &entries);

  Tool as_tool();

  size_t chunk_count() const {
    return chunks_.size();
  }
  bool has_documents() const {
    return !index_.empty();
  }
  const std::vector<Chunk> &chunks() const {
    return chunks_;
  }
  // Distinct source names in load order
  std::vector<std::string> sources() const;

  const RetrievalOptions &options() const {
    return options_;
  }

 private:
  std::vector<Chunk> extract_chunks(const std::filesystem::path &path, size_t first_index,
                                    LoadedDocument &document) const;

  std::shared_ptr<EmbeddingClient> embedding_client_;
  std::shared_ptr<ContentExtractorFactory> extractor_factory_;
  RetrievalOptions options_;
  text::Chunker chunker_;

  std::vector<Chunk> chunks_;
  VectorIndex index_;
};

}  // namespace ragdesk_core
