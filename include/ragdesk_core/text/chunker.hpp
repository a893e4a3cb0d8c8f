#pragma once

#include <string>
#include <vector>

namespace ragdesk_core::text {

struct ChunkerOptions {
  // A chunk is closed before a sentence would push it past this many characters, separators included
  size_t max_size = 1000;
  // Budget in characters for the trailing sentences repeated at the head of the next chunk
  size_t overlap = 200;
};

/**
 * @class Chunker
 * @brief Splits normalized text into overlapping, sentence-aligned chunks.
 *
 * Sentences are accumulated greedily until the next one would push the chunk
 * past max_size. When a chunk is closed, its trailing sentences (up to the
 * overlap budget, but always at least one) seed the next chunk, so adjacent
 * chunks always share a sentence. Sentences are never split: a chunk can run
 * past max_size when the carried overlap is followed by a long sentence.
 */
class Chunker {
 public:
  explicit Chunker(ChunkerOptions options = {});

  std::vector<std::string> chunk(const std::string& text) const;

  // Splits after '.', '!' or '?' followed by whitespace. The text is trimmed
  // first and the whitespace run at each boundary is dropped.
  static std::vector<std::string> split_sentences(const std::string& text);

  const ChunkerOptions& options() const {
    return options_;
  }

 private:
  ChunkerOptions options_;

  std::vector<std::string> overlap_window(const std::vector<std::string>& closed,
                                          size_t& window_length) const;
  static std::string join_sentences(const std::vector<std::string>& sentences);
};

// Convenience wrapper around Chunker
std::vector<std::string> chunk_text(const std::string& text, size_t max_size, size_t overlap);

}  // namespace ragdesk_core::text
