#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "encoding_sniffer.hpp"
#include "pool_errors.hpp"
#include "test_support.hpp"

namespace pool_visualizer {
namespace {

using namespace std::string_literals;

TEST(EncodingSnifferTest, NoMarkDefaultsToUtf8) {
  EXPECT_EQ(EncodingSniffer::SniffBytes("Tag,DateTime\n"), TextEncoding::Utf8);
  EXPECT_EQ(EncodingSniffer::SniffBytes(""), TextEncoding::Utf8);
}

TEST(EncodingSnifferTest, RecognisesEachMark) {
  EXPECT_EQ(EncodingSniffer::SniffBytes("\xEF\xBB\xBF" "Tag"s),
            TextEncoding::Utf8);
  EXPECT_EQ(EncodingSniffer::SniffBytes("\xFE\xFF\x00T"s),
            TextEncoding::Utf16Be);
  EXPECT_EQ(EncodingSniffer::SniffBytes("\x00\x00\xFE\xFF"s),
            TextEncoding::Utf32Be);
}

TEST(EncodingSnifferTest, FfFeResolvesToUtf16BeforeUtf16Le) {
  EXPECT_EQ(EncodingSniffer::SniffBytes("\xFF\xFE" "T\0a\0"s),
            TextEncoding::Utf16);
}

TEST(EncodingSnifferTest, Utf32LeMarkWinsOverItsUtf16Prefix) {
  EXPECT_EQ(EncodingSniffer::SniffBytes("\xFF\xFE\x00\x00" "T\0\0\0"s),
            TextEncoding::Utf32Le);
}

TEST(EncodingSnifferTest, Names) {
  EXPECT_STREQ(EncodingSniffer::Name(TextEncoding::Utf8), "utf-8");
  EXPECT_STREQ(EncodingSniffer::Name(TextEncoding::Utf16), "utf-16");
  EXPECT_STREQ(EncodingSniffer::Name(TextEncoding::Utf32Be), "utf-32be");
  EXPECT_STREQ(EncodingSniffer::Name(TextEncoding::Utf32Le), "utf-32le");
  EXPECT_STREQ(EncodingSniffer::Name(TextEncoding::Utf16Be), "utf-16be");
  EXPECT_STREQ(EncodingSniffer::Name(TextEncoding::Utf16Le), "utf-16le");
}

TEST(EncodingSnifferTest, DecodesUtf16LittleEndian) {
  auto [text, err] = EncodingSniffer::DecodeToUtf8(
      "\xFF\xFE" "A\0\xE9\0"s, TextEncoding::Utf16);
  ASSERT_FALSE(err) << err->What();
  EXPECT_EQ(text, "A\xC3\xA9");
}

TEST(EncodingSnifferTest, DecodesUtf16BigEndianSurrogatePair) {
  auto [text, err] = EncodingSniffer::DecodeToUtf8(
      "\xFE\xFF\xD8\x3D\xDE\x00"s, TextEncoding::Utf16Be);
  ASSERT_FALSE(err) << err->What();
  EXPECT_EQ(text, "\xF0\x9F\x98\x80");
}

TEST(EncodingSnifferTest, DecodesUtf32) {
  auto [be, beErr] = EncodingSniffer::DecodeToUtf8(
      "\x00\x00\xFE\xFF\x00\x00\x00" "X"s, TextEncoding::Utf32Be);
  ASSERT_FALSE(beErr) << beErr->What();
  EXPECT_EQ(be, "X");

  auto [le, leErr] = EncodingSniffer::DecodeToUtf8(
      "\xFF\xFE\x00\x00" "X\0\0\0"s, TextEncoding::Utf32Le);
  ASSERT_FALSE(leErr) << leErr->What();
  EXPECT_EQ(le, "X");
}

TEST(EncodingSnifferTest, TruncatedUtf16IsAnEncodingError) {
  auto [text, err] =
      EncodingSniffer::DecodeToUtf8("\xFF\xFE" "A"s, TextEncoding::Utf16);
  ASSERT_TRUE(err != nullptr);
  std::shared_ptr<EncodingError> encodingErr;
  EXPECT_TRUE(errors::As(err, &encodingErr));
}

TEST(EncodingSnifferTest, UnpairedSurrogateIsAnEncodingError) {
  auto [text, err] = EncodingSniffer::DecodeToUtf8("\xDC\x00"s,
                                                   TextEncoding::Utf16Be);
  ASSERT_TRUE(err != nullptr);
  std::shared_ptr<EncodingError> encodingErr;
  EXPECT_TRUE(errors::As(err, &encodingErr));
}

class EncodingSnifferFileTest : public test_support::TempDirTest {};

TEST_F(EncodingSnifferFileTest, SniffsFromFile) {
  auto path = WriteFile("a_pool.csv", "\xFE\xFF\x00T"s);
  auto [encoding, err] = EncodingSniffer::Sniff(path);
  ASSERT_FALSE(err) << err->What();
  EXPECT_EQ(encoding, TextEncoding::Utf16Be);
}

TEST_F(EncodingSnifferFileTest, ReadTextFileStripsUtf8Mark) {
  auto path = WriteFile("b_pool.csv", "\xEF\xBB\xBF" "Tag,DateTime\n"s);
  auto [text, err] = EncodingSniffer::ReadTextFile(path);
  ASSERT_FALSE(err) << err->What();
  EXPECT_EQ(text, "Tag,DateTime\n");
}

TEST_F(EncodingSnifferFileTest, MissingFileFails) {
  auto [encoding, err] =
      EncodingSniffer::Sniff((dir / "missing_pool.csv").string());
  EXPECT_TRUE(err != nullptr);
}

}  // namespace
}  // namespace pool_visualizer
