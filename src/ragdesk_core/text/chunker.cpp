#include "ragdesk_core/text/chunker.hpp"

#include "ragdesk_core/text/text_utils.hpp"

namespace ragdesk_core::text {

namespace {
bool is_terminal_punctuation(char c) {
  return c == '.' || c == '!' || c == '?';
}
}  // namespace

Chunker::Chunker(ChunkerOptions options) : options_(options) {}

std::vector<std::string> Chunker::split_sentences(const std::string& text) {
  std::vector<std::string> sentences;

  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && is_space(text[begin]))
    ++begin;
  while (end > begin && is_space(text[end - 1]))
    --end;

  size_t sentence_start = begin;
  size_t i = begin;
  while (i < end) {
    if (is_terminal_punctuation(text[i]) && i + 1 < end && is_space(text[i + 1])) {
      sentences.emplace_back(text, sentence_start, i + 1 - sentence_start);
      size_t next = i + 1;
      while (next < end && is_space(text[next]))
        ++next;
      sentence_start = next;
      i = next;
      continue;
    }
    ++i;
  }
  if (sentence_start < end) {
    sentences.emplace_back(text, sentence_start, end - sentence_start);
  }
  return sentences;
}

std::vector<std::string> Chunker::chunk(const std::string& text) const {
  std::vector<std::string> chunks;
  const std::vector<std::string> sentences = split_sentences(text);

  std::vector<std::string> current;
  size_t current_length = 0;  // length of the joined chunk, separators included

  for (const std::string& sentence : sentences) {
    const size_t sentence_length = utf8_length(sentence);

    if (!current.empty() && current_length + 1 + sentence_length > options_.max_size) {
      chunks.push_back(join_sentences(current));
      current = overlap_window(current, current_length);
    }

    current_length += (current.empty() ? 0 : 1) + sentence_length;
    current.push_back(sentence);
  }

  // The last chunk has no successor, so no overlap is carried out of it
  if (!current.empty()) {
    chunks.push_back(join_sentences(current));
  }
  return chunks;
}

std::vector<std::string> Chunker::overlap_window(const std::vector<std::string>& closed,
                                                 size_t& window_length) const {
  size_t first = closed.size();
  size_t length = 0;
  while (first > 0) {
    const bool window_empty = first == closed.size();
    const size_t added = utf8_length(closed[first - 1]) + (window_empty ? 0 : 1);
    // The most recent sentence is carried even when it alone exceeds the overlap budget
    if (!window_empty && length + added > options_.overlap) {
      break;
    }
    length += added;
    --first;
  }
  window_length = length;
  return std::vector<std::string>(closed.begin() + static_cast<std::ptrdiff_t>(first),
                                  closed.end());
}

std::string Chunker::join_sentences(const std::vector<std::string>& sentences) {
  std::string joined;
  for (size_t i = 0; i < sentences.size(); ++i) {
    if (i > 0) {
      joined.push_back(' ');
    }
    joined += sentences[i];
  }
  return joined;
}

std::vector<std::string> chunk_text(const std::string& text, size_t max_size, size_t overlap) {
  return Chunker(ChunkerOptions{max_size, overlap}).chunk(text);
}

}  // namespace ragdesk_core::text
