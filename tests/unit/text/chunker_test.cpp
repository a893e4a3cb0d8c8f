#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "ragdesk_core/text/chunker.hpp"
#include "ragdesk_core/text/text_utils.hpp"
#include "../../common/utilities_test.hpp"

namespace ragdesk_core::text {

namespace {

// Sentences of a chunk in order, as the chunker split them
std::vector<std::string> sentences_of(const std::string& chunk) {
  return Chunker::split_sentences(chunk);
}

// Each chunk after the first opens with a run of trailing sentences of the
// chunk before it, and that run ends with the previous chunk's last sentence
void expect_adjacent_chunks_overlap(const std::vector<std::string>& chunks) {
  for (size_t i = 0; i + 1 < chunks.size(); ++i) {
    auto previous = sentences_of(chunks[i]);
    auto next = sentences_of(chunks[i + 1]);
    auto start = std::find(previous.begin(), previous.end(), next.front());
    ASSERT_NE(start, previous.end()) << "chunk " << i + 1 << " does not overlap";
    size_t overlap_count = static_cast<size_t>(previous.end() - start);
    ASSERT_LE(overlap_count, next.size());
    EXPECT_TRUE(std::equal(start, previous.end(), next.begin())) << "chunk " << i + 1;
  }
}

}  // namespace

TEST(ChunkerTest, SplitSentences_OnTerminalPunctuationFollowedByWhitespace) {
  auto sentences = Chunker::split_sentences("First one. Second one!  Third one?\nFourth");
  ASSERT_EQ(sentences.size(), 4u);
  EXPECT_EQ(sentences[0], "First one.");
  EXPECT_EQ(sentences[1], "Second one!");
  EXPECT_EQ(sentences[2], "Third one?");
  EXPECT_EQ(sentences[3], "Fourth");
}

TEST(ChunkerTest, SplitSentences_DoesNotSplitInsideTokens) {
  auto sentences = Chunker::split_sentences("Version 2.5 is out. See example.com now.");
  ASSERT_EQ(sentences.size(), 2u);
  EXPECT_EQ(sentences[0], "Version 2.5 is out.");
  EXPECT_EQ(sentences[1], "See example.com now.");
}

TEST(ChunkerTest, EmptyInputProducesNoChunks) {
  Chunker chunker;
  EXPECT_TRUE(chunker.chunk("").empty());
  EXPECT_TRUE(chunker.chunk("   \n\n  ").empty());
}

TEST(ChunkerTest, ShortDocumentIsSingleChunk) {
  auto chunks = chunk_text("RAG uses retrieval plus generation. It reduces hallucination.", 1000, 200);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "RAG uses retrieval plus generation. It reduces hallucination.");
}

TEST(ChunkerTest, TrailingSentenceWithoutPunctuationIsKept) {
  auto chunks = chunk_text("Complete sentence. trailing fragment", 1000, 200);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "Complete sentence. trailing fragment");
}

// 50 sentences of 49 characters: 2499 characters of text
TEST(ChunkerTest, LongDocumentProducesThreeOverlappingChunks) {
  const std::string text = ragdesk_tests::TestUtilities::create_test_paragraph(50, 49);
  ASSERT_EQ(utf8_length(text), 2499u);

  auto chunks = chunk_text(text, 1000, 200);
  ASSERT_EQ(chunks.size(), 3u);
  for (size_t i = 0; i + 1 < chunks.size(); ++i) {
    EXPECT_LE(utf8_length(chunks[i]), 1000u) << "chunk " << i;
  }

  // Four trailing sentences (199 characters) fit the overlap budget
  const std::string tail = chunks[0].substr(chunks[0].size() - 199);
  EXPECT_EQ(chunks[1].substr(0, 199), tail);
  EXPECT_EQ(sentences_of(chunks[1]).front(), ragdesk_tests::TestUtilities::create_test_sentence(17, 49));
  EXPECT_EQ(sentences_of(chunks[2]).front(), ragdesk_tests::TestUtilities::create_test_sentence(33, 49));
}

TEST(ChunkerTest, EverySentenceAppearsAndOrderIsPreserved) {
  const std::string text = ragdesk_tests::TestUtilities::create_test_paragraph(37, 60);
  auto chunks = chunk_text(text, 300, 100);

  // Dropping each chunk's overlap prefix must reproduce the sentence sequence exactly
  std::vector<std::string> rebuilt;
  for (const auto& chunk : chunks) {
    for (const auto& sentence : sentences_of(chunk)) {
      if (!rebuilt.empty() && std::find(rebuilt.begin(), rebuilt.end(), sentence) != rebuilt.end()) {
        continue;
      }
      rebuilt.push_back(sentence);
    }
  }
  EXPECT_EQ(rebuilt, Chunker::split_sentences(text));
}

TEST(ChunkerTest, NextChunkStartsWithSuffixOfPreviousChunk) {
  const std::string text = ragdesk_tests::TestUtilities::create_test_paragraph(30, 45);
  auto chunks = chunk_text(text, 250, 120);
  ASSERT_GT(chunks.size(), 1u);
  expect_adjacent_chunks_overlap(chunks);
}

TEST(ChunkerTest, OverlapKeepsAtLeastOneSentenceEvenIfOverBudget) {
  const std::string text = ragdesk_tests::TestUtilities::create_test_paragraph(6, 40);
  auto chunks = chunk_text(text, 100, 10);
  ASSERT_GT(chunks.size(), 1u);
  for (size_t i = 0; i + 1 < chunks.size(); ++i) {
    EXPECT_EQ(sentences_of(chunks[i]).back(), sentences_of(chunks[i + 1]).front());
  }
}

TEST(ChunkerTest, OversizedSentenceIsNeverSplitAndStillOverlaps) {
  const std::string huge = ragdesk_tests::TestUtilities::create_test_sentence(2, 150);
  const std::string text = "Short one. " + huge + " Short two.";
  auto chunks = chunk_text(text, 100, 20);

  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0], "Short one.");
  EXPECT_EQ(chunks[1], "Short one. " + huge);
  EXPECT_EQ(chunks[2], huge + " Short two.");
  expect_adjacent_chunks_overlap(chunks);
}

TEST(ChunkerTest, LastSentenceIsCarriedEvenBeforeALongSentence) {
  const std::string a = ragdesk_tests::TestUtilities::create_test_sentence(1, 300);
  const std::string b = ragdesk_tests::TestUtilities::create_test_sentence(2, 300);
  const std::string d = ragdesk_tests::TestUtilities::create_test_sentence(3, 750);
  auto chunks = chunk_text(a + " " + b + " " + d, 1000, 200);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0], a + " " + b);
  EXPECT_EQ(chunks[1], b + " " + d);
}

TEST(ChunkerTest, OverlapTakesEveryTrailingSentenceWithinBudget) {
  // 30 + 1 + 30 = 61 fits an overlap budget of 80
  const std::string a = ragdesk_tests::TestUtilities::create_test_sentence(1, 30);
  const std::string b = ragdesk_tests::TestUtilities::create_test_sentence(2, 30);
  const std::string c = ragdesk_tests::TestUtilities::create_test_sentence(3, 60);
  auto chunks = chunk_text(a + " " + b + " " + c, 100, 80);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0], a + " " + b);
  EXPECT_EQ(chunks[1], a + " " + b + " " + c);
}

TEST(ChunkerTest, AdjacentChunksAlwaysShareASentence) {
  // Mixed lengths, including sentences longer than the whole budget
  std::vector<size_t> lengths = {40, 220, 35, 35, 180, 60, 300, 20, 20, 20, 150, 45};
  std::string text;
  for (size_t i = 0; i < lengths.size(); ++i) {
    if (i > 0) {
      text += " ";
    }
    text += ragdesk_tests::TestUtilities::create_test_sentence(static_cast<int>(i), lengths[i]);
  }

  auto chunks = chunk_text(text, 200, 50);
  ASSERT_GT(chunks.size(), 3u);
  expect_adjacent_chunks_overlap(chunks);
}

TEST(ChunkerTest, ZeroOverlapStillCarriesLastSentence) {
  auto chunks = chunk_text("Alpha one. Beta two. Gamma three.", 22, 0);
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0], "Alpha one. Beta two.");
  EXPECT_EQ(chunks[1], "Beta two. Gamma three.");
}

TEST(ChunkerTest, LengthsAreMeasuredInCodePoints) {
  // Each sentence is 10 code points but 20 bytes
  const std::string sentence = "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9.";
  ASSERT_EQ(utf8_length(sentence), 10u);
  const std::string text = sentence + " " + sentence;
  auto chunks = chunk_text(text, 21, 5);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], text);
}

TEST(ChunkerTest, TerminatesOnPunctuationOnlyText) {
  auto chunks = chunk_text(". . . ! ! ? ?", 3, 1);
  EXPECT_FALSE(chunks.empty());
}

}  // namespace ragdesk_core::text
