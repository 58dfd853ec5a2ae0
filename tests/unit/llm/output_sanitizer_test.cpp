#include <gtest/gtest.h>

#include <string>

#include "ragdesk_core/llm/output_sanitizer.hpp"

namespace ragdesk_core {

TEST(DelimitedBlockSanitizerTest, RemovesLeadingThinkBlock) {
  DelimitedBlockSanitizer sanitizer;

  EXPECT_EQ(sanitizer.sanitize("<think>\nreasoning here\n</think>\n\nWeek 2 [1]."), "Week 2 [1].");
}

TEST(DelimitedBlockSanitizerTest, RemovesEveryBlockNonGreedily) {
  DelimitedBlockSanitizer sanitizer;

  EXPECT_EQ(sanitizer.sanitize("A <think>x</think> B <think>y</think> C"), "A B C");
}

TEST(DelimitedBlockSanitizerTest, KeepsUnterminatedBlock) {
  DelimitedBlockSanitizer sanitizer;

  EXPECT_EQ(sanitizer.sanitize("<think>never closed"), "<think>never closed");
}

TEST(DelimitedBlockSanitizerTest, IsCaseSensitive) {
  DelimitedBlockSanitizer sanitizer;

  EXPECT_EQ(sanitizer.sanitize("<THINK>x</THINK> answer"), "<THINK>x</THINK> answer");
}

TEST(DelimitedBlockSanitizerTest, TrimsSurroundingWhitespace) {
  DelimitedBlockSanitizer sanitizer;

  EXPECT_EQ(sanitizer.sanitize("\n  plain answer \n"), "plain answer");
  EXPECT_EQ(sanitizer.sanitize("<think>only thoughts</think>"), "");
}

TEST(DelimitedBlockSanitizerTest, CustomDelimiters) {
  DelimitedBlockSanitizer sanitizer("[[", "]]");

  EXPECT_EQ(sanitizer.sanitize("[[scratch]] final"), "final");
}

TEST(IdentitySanitizerTest, ReturnsInputUnchanged) {
  IdentitySanitizer sanitizer;

  EXPECT_EQ(sanitizer.sanitize("  <think>x</think> raw \n"), "  <think>x</think> raw \n");
}

}  // namespace ragdesk_core
