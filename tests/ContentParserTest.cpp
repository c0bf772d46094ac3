#include "ContentParser.hpp"

#include <gtest/gtest.h>

namespace {

bool Valid(const std::string& s, size_t* offset = nullptr) {
  size_t bad = 0;
  bool ok = ContentParser::is_valid_utf8(s, bad);
  if (offset) *offset = bad;
  return ok;
}

TEST(ContentParserTest, AcceptsWellFormedUtf8) {
  EXPECT_TRUE(Valid(""));
  EXPECT_TRUE(Valid("plain ascii\n"));
  EXPECT_TRUE(Valid("h\xC3\xA9llo \xE2\x82\xAC \xF0\x9D\x84\x9E"));
  EXPECT_TRUE(Valid("\xF4\x8F\xBF\xBF"));  // U+10FFFF
}

TEST(ContentParserTest, RejectsMalformedUtf8) {
  size_t off = 0;
  EXPECT_FALSE(Valid("\x80", &off));
  EXPECT_EQ(off, 0u);
  EXPECT_FALSE(Valid("ab\xE2\x82", &off));  // truncated
  EXPECT_EQ(off, 2u);
  EXPECT_FALSE(Valid("x\xC0\xAF", &off));  // overlong '/'
  EXPECT_EQ(off, 1u);
  EXPECT_FALSE(Valid("\xE0\x80\xAF"));      // overlong 3-byte
  EXPECT_FALSE(Valid("\xED\xA0\x80"));      // surrogate
  EXPECT_FALSE(Valid("\xF4\x90\x80\x80"));  // above U+10FFFF
  EXPECT_FALSE(Valid("\xC3\x28"));          // bad continuation
  EXPECT_FALSE(Valid("\xFF"));
}

TEST(ContentParserTest, NormalizesNewlines) {
  EXPECT_EQ(ContentParser::normalize_newlines("a\r\nb\rc\n"), "a\nb\nc\n");
  EXPECT_EQ(ContentParser::normalize_newlines("\r\r\n"), "\n\n");
  EXPECT_EQ(ContentParser::normalize_newlines("no change\n"), "no change\n");
  EXPECT_EQ(ContentParser::normalize_newlines(""), "");
}

}  // namespace
