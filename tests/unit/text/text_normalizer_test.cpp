#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "ragdesk_core/text/text_normalizer.hpp"

namespace ragdesk_core::text {

TEST(TextNormalizerTest, CollapsesLongNewlineRunsToBlankLine) {
  EXPECT_EQ(normalize("First paragraph.\n\n\n\nSecond paragraph."),
            "First paragraph.\n\nSecond paragraph.");
}

TEST(TextNormalizerTest, KeepsSingleAndDoubleNewlines) {
  EXPECT_EQ(normalize("line one\nline two\n\nline three"), "line one\nline two\n\nline three");
}

TEST(TextNormalizerTest, CollapsesRepeatedSpaces) {
  EXPECT_EQ(normalize("too     many   spaces here"), "too many spaces here");
}

TEST(TextNormalizerTest, StripsLeadingAndTrailingWhitespace) {
  EXPECT_EQ(normalize("  \n\t padded text \n\n "), "padded text");
}

TEST(TextNormalizerTest, EmptyAndWhitespaceOnlyInputBecomeEmpty) {
  EXPECT_EQ(normalize(""), "");
  EXPECT_EQ(normalize("   \n\n\n  \t"), "");
}

TEST(TextNormalizerTest, LeavesTabsInsideTextAlone) {
  EXPECT_EQ(normalize("col1\tcol2"), "col1\tcol2");
}

TEST(TextNormalizerTest, PreservesMultibyteCharacters) {
  EXPECT_EQ(normalize("caf\xC3\xA9   na\xC3\xAFve"), "caf\xC3\xA9 na\xC3\xAFve");
}

TEST(TextNormalizerTest, IsIdempotent) {
  const std::vector<std::string> inputs = {
      "  Hello   world.\n\n\n\nNext   paragraph.  ",
      "a\n \n \n b",
      "\n\n\n\n",
      "x  \n\n\n  y",
      "One. Two.   Three!\n\n\n\n\nFour?",
  };
  for (const auto& input : inputs) {
    const std::string once = normalize(input);
    EXPECT_EQ(normalize(once), once) << "input: " << input;
  }
}

}  // namespace ragdesk_core::text
