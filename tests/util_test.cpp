#include "sqlrpc/util/id.hpp"
#include "sqlrpc/util/util.hpp"

#include "test_utils.hpp"

#include <regex>
#include <set>

#include <gtest/gtest.h>

using namespace sqlrpc;

TEST(Base64Test, DecodesPaddedInput) {
  EXPECT_EQ(decode_base64("c2VsZWN0IDE="), "select 1");
  EXPECT_EQ(decode_base64("c2VsZWN0IDEx"), "select 11");
  EXPECT_EQ(decode_base64("YQ=="), "a");
  EXPECT_EQ(decode_base64(""), "");
}

TEST(Base64Test, IgnoresWhitespace) {
  EXPECT_EQ(decode_base64("c2Vs\nZWN0\r\nIDE="), "select 1");
}

TEST(Base64Test, RejectsMalformedInput) {
  EXPECT_FALSE(decode_base64("c2V*").has_value());
  EXPECT_FALSE(decode_base64("YQ==YQ").has_value());
  EXPECT_FALSE(decode_base64("Y").has_value());
  EXPECT_FALSE(decode_base64("YQ===").has_value());
}

TEST(Base64Test, EncodeMatchesDecode) {
  for (std::string_view text : {"", "a", "ab", "abc", "select * from t"}) {
    EXPECT_EQ(decode_base64(encode_base64(text)), text);
  }
  EXPECT_EQ(encode_base64("select 1"), "c2VsZWN0IDE=");
}

TEST(UtilTest, Trim) {
  EXPECT_EQ(trim("  select 1\n\t"), "select 1");
  EXPECT_EQ(trim("   "), "");
  EXPECT_EQ(trim("x"), "x");
}

TEST(UtilTest, ReadFile) {
  test::TempDir dir;
  test::write_file(dir / "a.sql", "select 1");
  auto text = read_file(dir / "a.sql");
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, "select 1");

  auto missing = read_file(dir / "missing.sql");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), make_error_code(Error::FileOpenFailed));
}

TEST(UtilTest, PreciseTimestampFormat) {
  std::regex pattern(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6}Z)");
  EXPECT_TRUE(std::regex_match(format_timestamp_precise(), pattern));
}

TEST(IdTest, TaskIdsAreUnique) {
  std::set<std::string> seen;
  for (int i = 0; i < 100; ++i) {
    EXPECT_TRUE(seen.insert(generate_task_id().str()).second);
  }
  EXPECT_EQ(TaskId("a"), TaskId("a"));
  EXPECT_NE(TaskId("a"), TaskId("b"));
}
