#include "utils/endian.hpp"
#include "utils/hash.hpp"
#include "utils/hex.hpp"
#include "utils/utf8.hpp"
#include "exception.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace jsonbcpp;
using jsonbcpp::test::bytes;

TEST(HexTest, DecodeAndEncode) {
  auto decoded = utils::hex_decode("0b2B00 00\nFf");
  EXPECT_EQ(decoded, bytes({0x0B, 0x2B, 0x00, 0x00, 0xFF}));
  EXPECT_EQ(utils::hex_encode(decoded), "0b2b0000ff");
  EXPECT_TRUE(utils::hex_decode("").empty());
}

TEST(HexTest, RejectsMalformedInput) {
  EXPECT_THROW(utils::hex_decode("abc"), jsonbcpp::exception);
  EXPECT_THROW(utils::hex_decode("zz"), jsonbcpp::exception);
}

TEST(EndianTest, BigEndian) {
  auto data = bytes({0x01, 0x02, 0x03, 0x04});
  EXPECT_EQ(utils::bytes_to_uint(BytesView(data), true), 0x01020304u);
  EXPECT_EQ(utils::bytes_to_uint(BytesView(data).slice(1, 3), true), 0x0203u);
}

TEST(EndianTest, LittleEndian) {
  auto data = bytes({0x01, 0x02, 0x03, 0x04});
  EXPECT_EQ(utils::bytes_to_uint(BytesView(data), false), 0x04030201u);
}

TEST(EndianTest, FullWidthAndLimits) {
  auto data = bytes({0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE, 0x00});
  EXPECT_EQ(utils::bytes_to_uint(BytesView(data).slice(0, 8), true), 0xFFFFFFFFFFFFFFFEull);
  EXPECT_EQ(utils::bytes_to_uint(BytesView(data).slice(0, 0), true), 0u);
  EXPECT_THROW(utils::bytes_to_uint(BytesView(data), true), jsonbcpp::exception);
}

TEST(HashTest, Djb2) {
  EXPECT_EQ(utils::djb2_hash(""), 5381u);
  EXPECT_EQ(utils::djb2_hash("a"), 5381u * 33u + 'a');
  EXPECT_NE(utils::djb2_hash("ab"), utils::djb2_hash("ba"));
}

TEST(Utf8Test, Validation) {
  EXPECT_TRUE(utils::is_valid_utf8(""));
  EXPECT_TRUE(utils::is_valid_utf8("ascii"));
  EXPECT_TRUE(utils::is_valid_utf8("\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80"));
  EXPECT_FALSE(utils::is_valid_utf8("\x80"));
  EXPECT_FALSE(utils::is_valid_utf8("\xC3"));
  EXPECT_FALSE(utils::is_valid_utf8("\xC0\x80"));          // overlong NUL
  EXPECT_FALSE(utils::is_valid_utf8("\xED\xA0\x80"));      // surrogate
  EXPECT_FALSE(utils::is_valid_utf8("\xF4\x90\x80\x80"));  // > U+10FFFF
}

TEST(Utf8Test, Append) {
  std::string out;
  EXPECT_TRUE(utils::append_utf8(out, U'A'));
  EXPECT_TRUE(utils::append_utf8(out, 0xE9));
  EXPECT_TRUE(utils::append_utf8(out, 0x20AC));
  EXPECT_TRUE(utils::append_utf8(out, 0x1F600));
  EXPECT_EQ(out, "A\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");
  EXPECT_FALSE(utils::append_utf8(out, 0xD800));
  EXPECT_FALSE(utils::append_utf8(out, 0x110000));
}
