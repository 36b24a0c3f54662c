#include "taskwarden/util/tail_buffer.hpp"
#include "taskwarden/util/utf8.hpp"

#include <string>

#include "gtest/gtest.h"

using namespace taskwarden;

namespace {

const std::string kE = "\xC3\xA9";         // é
const std::string kEuro = "\xE2\x82\xAC";  // €
const std::string kReplacement{utf8::kReplacement};

}  // namespace

TEST(Utf8Test, Sanitize_ValidText_IsUnchanged) {
  auto text = "plain " + kE + " and " + kEuro + " \xF0\x9F\x98\x80";

  EXPECT_TRUE(utf8::is_valid(text));
  EXPECT_EQ(utf8::sanitize(text), text);
}

TEST(Utf8Test, Sanitize_StrayBytes_BecomeReplacementCharacters) {
  EXPECT_EQ(utf8::sanitize("a\xA9z"), "a" + kReplacement + "z");
  EXPECT_EQ(utf8::sanitize("a\xFFz"), "a" + kReplacement + "z");
  EXPECT_EQ(utf8::sanitize("end\xC3"), "end" + kReplacement);
}

TEST(Utf8Test, Sanitize_OverlongAndSurrogate_AreRejected) {
  EXPECT_FALSE(utf8::is_valid("\xC0\xAF"));
  EXPECT_FALSE(utf8::is_valid("\xE0\x80\xAF"));
  EXPECT_FALSE(utf8::is_valid("\xED\xA0\x80"));
  EXPECT_FALSE(utf8::is_valid("\xF4\x90\x80\x80"));
  EXPECT_TRUE(utf8::is_valid("\xF4\x8F\xBF\xBF"));
}

TEST(TailOfTest, CutInsideCharacter_DropsThePartialCharacter) {
  auto text = kE + std::string(1999, 'a');

  auto tail = tail_of(text, 2000);

  EXPECT_EQ(tail, std::string(1999, 'a'));
  EXPECT_TRUE(utf8::is_valid(tail));
}

TEST(TailOfTest, CutOnBoundary_KeepsWholeCharacter) {
  auto text = "xx" + kEuro + "abc";

  EXPECT_EQ(tail_of(text, 6), kEuro + "abc");
  EXPECT_EQ(tail_of(text, 5), "abc");
}

TEST(TailOfTest, ShortInput_IsReturnedSanitized) {
  EXPECT_EQ(tail_of("short", 100), "short");
  EXPECT_EQ(tail_of("bad\xA9", 100), "bad" + kReplacement);
}

TEST(TailBufferTest, View_KeepsLastCapacityBytes) {
  TailBuffer buf(4);

  buf.append("abc");
  buf.append("defg");

  EXPECT_EQ(buf.view(), "defg");
  EXPECT_EQ(buf.total_bytes(), 7u);
}

TEST(TailBufferTest, View_NeverStartsInsideCharacter) {
  TailBuffer buf(4);

  buf.append("a" + kEuro + "bc");

  EXPECT_EQ(buf.view(), "bc");
}

TEST(TailBufferTest, View_UntrimmedStreamIsUntouched) {
  TailBuffer buf(8);

  buf.append("\xA9xyz");

  EXPECT_EQ(buf.view(), "\xA9xyz");
}
