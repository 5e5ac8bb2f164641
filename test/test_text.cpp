#include "text.hpp"
#include "exception.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <vector>

using namespace jsonbcpp;
using jsonbcpp::test::encode;

// Holds the encoded bytes so the decoded Value's view stays valid.
struct Encoded {
  std::vector<std::byte> data;
  Value value;

  Encoded(uint8_t type, std::string_view payload)
      : data(encode(type, payload)), value(Value::from(data)) {}
};

struct TextTest : public ::testing::Test {
  static std::string decode(uint8_t type, std::string_view payload) {
    Encoded encoded(type, payload);
    return decode_string(encoded.value);
  }

  static ErrorKind failure(uint8_t type, std::string_view payload) {
    Encoded encoded(type, payload);
    try {
      decode_string(encoded.value);
    } catch (const decode_error &e) {
      return e.kind();
    }
    ADD_FAILURE() << "decode_string did not throw for \"" << payload << "\"";
    return ErrorKind::UnknownType;
  }
};

TEST_F(TextTest, PlainTextIsVerbatim) {
  EXPECT_EQ(decode(0x7, "hello"), "hello");
  EXPECT_EQ(decode(0x7, ""), "");
  EXPECT_EQ(decode(0x7, "caf\xC3\xA9"), "caf\xC3\xA9");
}

TEST_F(TextTest, RawTextIsVerbatim) {
  EXPECT_EQ(decode(0xA, "say \"hi\"\n"), "say \"hi\"\n");
}

TEST_F(TextTest, Rfc8259Escapes) {
  EXPECT_EQ(decode(0x8, R"(a\"b\\c\/d)"), "a\"b\\c/d");
  EXPECT_EQ(decode(0x8, R"(\b\f\n\r\t)"), "\b\f\n\r\t");
  EXPECT_EQ(decode(0x8, R"(\u0041\u00e9)"), "A\xC3\xA9");
  EXPECT_EQ(decode(0x8, R"(\ud83d\ude00)"), "\xF0\x9F\x98\x80");
}

TEST_F(TextTest, Json5Escapes) {
  EXPECT_EQ(decode(0x9, R"(it\'s)"), "it's");
  EXPECT_EQ(decode(0x9, R"(\x41\v)"), "A\v");
  EXPECT_EQ(decode(0x9, "a\\\nb"), "ab");
  EXPECT_EQ(decode(0x9, "a\\\r\nb"), "ab");
  EXPECT_EQ(decode(0x9, "a\\\xE2\x80\xA8" "b"), "ab");
  EXPECT_EQ(decode(0x9, R"(\u0041\n)"), "A\n");
  std::string nul = decode(0x9, R"(a\0b)");
  EXPECT_EQ(nul, std::string("a\0b", 3));
}

TEST_F(TextTest, Json5EscapesAreRejectedInRfc8259Text) {
  EXPECT_EQ(failure(0x8, R"(\x41)"), ErrorKind::InvalidUTF8);
  EXPECT_EQ(failure(0x8, R"(it\'s)"), ErrorKind::InvalidUTF8);
}

TEST_F(TextTest, MalformedEscapes) {
  EXPECT_EQ(failure(0x8, R"(\q)"), ErrorKind::InvalidUTF8);
  EXPECT_EQ(failure(0x8, "abc\\"), ErrorKind::InvalidUTF8);
  EXPECT_EQ(failure(0x8, R"(\u12)"), ErrorKind::InvalidUTF8);
  EXPECT_EQ(failure(0x8, R"(\u12zz)"), ErrorKind::InvalidUTF8);
  EXPECT_EQ(failure(0x8, R"(\ud83d)"), ErrorKind::InvalidUTF8);
  EXPECT_EQ(failure(0x8, R"(\ude00)"), ErrorKind::InvalidUTF8);
  EXPECT_EQ(failure(0x9, R"(\xZ1)"), ErrorKind::InvalidUTF8);
}

TEST_F(TextTest, InvalidUtf8Payload) {
  EXPECT_EQ(failure(0x7, "\xC3"), ErrorKind::InvalidUTF8);
  EXPECT_EQ(failure(0xA, "\xC0\xAF"), ErrorKind::InvalidUTF8);
  EXPECT_EQ(failure(0x8, "\xED\xA0\x80"), ErrorKind::InvalidUTF8);
}

TEST_F(TextTest, NonTextIsUnhandled) {
  Encoded number(0x3, "12");
  try {
    decode_string(number.value);
    FAIL() << "expected decode_error";
  } catch (const decode_error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::UnhandledType);
    EXPECT_EQ(e.detail(), 0x3);
  }
  EXPECT_THROW(decode_key(Value::null()), decode_error);
}

TEST_F(TextTest, KeysUseStringRules) {
  Encoded key(0x8, R"(k\u0031)");
  EXPECT_EQ(decode_key(key.value), "k1");
}
