#include "ragdesk_core/services/retrieval_service.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <iterator>
#include <stdexcept>

#include "ragdesk_core/text/text_normalizer.hpp"
#include "ragdesk_core/text/text_utils.hpp"

namespace ragdesk_core {

RetrievalService::RetrievalService(std::shared_ptr<EmbeddingClient> embedding_client,
                                   std::shared_ptr<ContentExtractorFactory> extractor_factory,
                                   RetrievalOptions options)
    : embedding_client_(std::move(embedding_client)),
      extractor_factory_(std::move(extractor_factory)),
      options_(options),
      chunker_(options.chunking) {
  if (!embedding_client_ || !extractor_factory_) {
    throw std::invalid_argument("RetrievalService requires an embedding client and an extractor factory");
  }
  if (options_.default_top_k == 0) {
    throw std::invalid_argument("default_top_k must be at least 1");
  }
}

LoadReport RetrievalService::load_documents(const std::vector<std::filesystem::path> &file_paths) {
  LoadReport report;

  // Extension preflight, before any file is read
  std::vector<std::filesystem::path> accepted;
  accepted.reserve(file_paths.size());
  for (const auto &path : file_paths) {
    if (extractor_factory_->supports(path)) {
      accepted.push_back(path);
      continue;
    }
    if (options_.load_policy == LoadPolicy::FailFast) {
      // Throws UnsupportedFormatError with the offending extension
      extractor_factory_->get_extractor_for(path);
    }
    std::string reason = "Unsupported file type: " + path.extension().string();
    std::cerr << "[RetrievalService] Failed to load " << path.string() << ": " << reason
              << std::endl;
    report.failed.push_back({path, reason});
  }

  std::vector<Chunk> new_chunks;
  for (const auto &path : accepted) {
    LoadedDocument document;
    try {
      std::vector<Chunk> document_chunks = extract_chunks(path, new_chunks.size(), document);
      std::move(document_chunks.begin(), document_chunks.end(), std::back_inserter(new_chunks));
    } catch (const ContentExtractorError &e) {
      if (options_.load_policy == LoadPolicy::FailFast) {
        throw;
      }
      std::cerr << "[RetrievalService] Failed to load " << path.string() << ": " << e.what()
                << std::endl;
      report.failed.push_back({path, e.what()});
      continue;
    }
    std::cout << "  Loaded " << document.source_name << ": " << document.chunk_count
              << " chunks" << std::endl;
    report.loaded.push_back(std::move(document));
  }

  report.total_chunks = new_chunks.size();

  if (new_chunks.empty()) {
    std::cout << "  No chunks created from documents." << std::endl;
    chunks_.clear();
    index_.clear();
    return report;
  }

  std::vector<std::string> texts;
  texts.reserve(new_chunks.size());
  for (const auto &chunk : new_chunks) {
    texts.push_back(chunk.content);
  }

  std::vector<std::vector<float>> embeddings = embedding_client_->get_embeddings(texts);
  if (embeddings.size() != new_chunks.size()) {
    throw EmbeddingError("Expected " + std::to_string(new_chunks.size()) + " embeddings, got " +
                         std::to_string(embeddings.size()));
  }

  VectorIndex new_index;
  new_index.build(embeddings);

  chunks_ = std::move(new_chunks);
  index_ = std::move(new_index);

  std::cout << "  Vector store ready: " << index_.size() << " vectors" << std::endl;
  return report;
}

std::vector<Chunk> RetrievalService::extract_chunks(const std::filesystem::path &path,
                                                    size_t first_index,
                                                    LoadedDocument &document) const {
  const ContentExtractor &extractor = extractor_factory_->get_extractor_for(path);

  std::string normalized = text::normalize(extractor.extract_text(path));
  std::vector<std::string> pieces = chunker_.chunk(normalized);

  document.source_name = path.filename().string();
  document.path = path;
  document.file_type = extractor.get_file_type();
  document.chunk_count = pieces.size();

  std::vector<Chunk> chunks;
  chunks.reserve(pieces.size());
  for (size_t i = 0; i < pieces.size(); ++i) {
    chunks.push_back(Chunk{.content = std::move(pieces[i]),
                           .source_name = document.source_name,
                           .chunk_index = static_cast<int>(first_index + i)});
  }
  return chunks;
}

std::vector<SearchResultEntry> RetrievalService::search_chunks(const std::string &query,
                                                               size_t k) {
  if (index_.empty()) {
    throw EmptyIndexError(kNoDocumentsMessage);
  }

  std::vector<float> query_embedding = embedding_client_->get_embedding(query);
  std::vector<Neighbor> neighbors = index_.query(query_embedding, k);

  std::vector<SearchResultEntry> entries;
  entries.reserve(neighbors.size());
  for (const auto &neighbor : neighbors) {
    if (neighbor.position >= chunks_.size()) {
      throw VectorIndexError("Index returned position " + std::to_string(neighbor.position) +
                             " outside the corpus");
    }
    const Chunk &chunk = chunks_[neighbor.position];
    entries.push_back(SearchResultEntry{
        .rank = entries.size() + 1,
        .distance = neighbor.distance,
        .chunk_index = chunk.chunk_index,
        .source_name = chunk.source_name,
        .excerpt = text::utf8_truncate(chunk.content, options_.excerpt_length)});
  }
  return entries;
}

std::string RetrievalService::search(const std::string &query, size_t k) {
  try {
    return format_results(search_chunks(query, k));
  } catch (const EmptyIndexError &) {
    return kNoDocumentsMessage;
  }
}

std::string RetrievalService::format_results(const std::vector<SearchResultEntry> &entries) {
  std::string out = "Document Search Results:\n\n";
  char distance[32];
  for (const auto &entry : entries) {
    std::snprintf(distance, sizeof(distance), "%.4f", entry.distance);
    out += "[" + std::to_string(entry.rank) + "] From: " + entry.source_name + "\n";
    out += "    " + entry.excerpt + "\n";
    out += "    (Relevance distance: " + std::string(distance) + ")\n\n";
  }
  return out;
}

Tool RetrievalService::as_tool() {
  return Tool{kToolName, kToolDescription,
              [this](const std::string &query) { return search(query); }};
}

std::vector<std::string> RetrievalService::sources() const {
  std::vector<std::string> names;
  for (const auto &chunk : chunks_) {
    if (std::find(names.begin(), names.end(), chunk.source_name) == names.end()) {
      names.push_back(chunk.source_name);
    }
  }
  return names;
}

}  // namespace ragdesk_core
