/**
 * @file test_util.cpp
 * @brief Tests for Base32/Base64, UTF-8 and string helpers
 */

#include <gtest/gtest.h>
#include "plaincfg/Util.hpp"
#include "plaincfg/Errors.hpp"

using namespace plaincfg;

// ============================================================================
// Base32
// ============================================================================

TEST(Base32, Rfc4648Vectors) {
    EXPECT_EQ(base32_encode(to_bytes("")), "");
    EXPECT_EQ(base32_encode(to_bytes("f")), "MY======");
    EXPECT_EQ(base32_encode(to_bytes("fo")), "MZXQ====");
    EXPECT_EQ(base32_encode(to_bytes("foo")), "MZXW6===");
    EXPECT_EQ(base32_encode(to_bytes("foob")), "MZXW6YQ=");
    EXPECT_EQ(base32_encode(to_bytes("fooba")), "MZXW6YTB");
    EXPECT_EQ(base32_encode(to_bytes("foobar")), "MZXW6YTBOI======");
}

TEST(Base32, BinaryData) {
    const Bytes data = {0x00, 0x01, 0xFF};
    EXPECT_EQ(base32_encode(data), "AAA76===");
    EXPECT_EQ(base32_decode("AAA76==="), data);
}

TEST(Base32, DecodeVectors) {
    EXPECT_EQ(base32_decode("MZXW6YTBOI======"), to_bytes("foobar"));
    EXPECT_TRUE(base32_decode("").empty());
}

TEST(Base32, RejectsLowercase) {
    EXPECT_THROW(base32_decode("mzxw6==="), EncodingError);
}

TEST(Base32, RejectsBadLength) {
    EXPECT_THROW(base32_decode("MZXW6"), EncodingError);
}

TEST(Base32, RejectsBadPadding) {
    EXPECT_THROW(base32_decode("MZX====="), EncodingError);
    EXPECT_THROW(base32_decode("MY======MZXW6YTB"), EncodingError);
    EXPECT_THROW(base32_decode("MY=A===="), EncodingError);
}

TEST(Base32, RejectsForeignCharacters) {
    EXPECT_THROW(base32_decode("MZXW1==="), EncodingError);
}

// ============================================================================
// Base64
// ============================================================================

TEST(Base64, Rfc4648Vectors) {
    EXPECT_EQ(base64_encode(to_bytes("")), "");
    EXPECT_EQ(base64_encode(to_bytes("f")), "Zg==");
    EXPECT_EQ(base64_encode(to_bytes("fo")), "Zm8=");
    EXPECT_EQ(base64_encode(to_bytes("foo")), "Zm9v");
    EXPECT_EQ(base64_encode(to_bytes("foobar")), "Zm9vYmFy");
}

TEST(Base64, EmbeddedNul) {
    const std::string s("a\0b", 3);
    EXPECT_EQ(base64_encode(to_bytes(s)), "YQBi");
    EXPECT_EQ(bytes_to_string(base64_decode("YQBi")), s);
}

TEST(Base64, DecodeWithPadding) {
    EXPECT_EQ(base64_decode("Zg=="), to_bytes("f"));
    EXPECT_EQ(base64_decode("Zm8="), to_bytes("fo"));
}

TEST(Base64, RejectsMalformed) {
    EXPECT_THROW(base64_decode("Zg="), EncodingError);
    EXPECT_THROW(base64_decode("Zg==Zm9v"), EncodingError);
    EXPECT_THROW(base64_decode("Zm9*"), EncodingError);
}

// ============================================================================
// UTF-8
// ============================================================================

TEST(Utf8, Validation) {
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8(u8"caf\u00e9 \u2192 \U0001F600"));
    EXPECT_FALSE(is_valid_utf8("\xff"));
    EXPECT_FALSE(is_valid_utf8("\xc3"));          // truncated
    EXPECT_FALSE(is_valid_utf8("\xc0\xaf"));      // overlong
    EXPECT_FALSE(is_valid_utf8("\xed\xa0\x80"));  // surrogate
}

TEST(Utf8, DecodeAndLength) {
    const std::string s = u8"a\u00e9\u2192";
    const std::u32string cps = utf8_decode(s);
    ASSERT_EQ(cps.size(), 3u);
    EXPECT_EQ(cps[0], U'a');
    EXPECT_EQ(cps[1], U'\u00e9');
    EXPECT_EQ(cps[2], U'\u2192');
    EXPECT_EQ(utf8_length(s), 3u);
    EXPECT_THROW(utf8_decode("\xff"), EncodingError);
}

TEST(Utf8, Offsets) {
    const std::string s = u8"a\u00e9b";
    const auto offsets = utf8_offsets(s);
    ASSERT_EQ(offsets.size(), 4u);
    EXPECT_EQ(offsets[0], 0u);
    EXPECT_EQ(offsets[1], 1u);
    EXPECT_EQ(offsets[2], 3u);
    EXPECT_EQ(offsets[3], 4u);
}

TEST(Utf8, Chars) {
    const auto chars = utf8_chars(u8"\\|\u2938");
    ASSERT_EQ(chars.size(), 3u);
    EXPECT_EQ(chars[0], "\\");
    EXPECT_EQ(chars[1], "|");
    EXPECT_EQ(chars[2], u8"\u2938");
}

TEST(Utf8, AppendRoundTrip) {
    std::string out;
    append_utf8(out, U'\U0001F600');
    EXPECT_EQ(out, u8"\U0001F600");
}

// ============================================================================
// Control characters and string helpers
// ============================================================================

TEST(ControlChars, Ranges) {
    EXPECT_TRUE(is_control(U'\0'));
    EXPECT_TRUE(is_control(U'\t'));
    EXPECT_TRUE(is_control(0x7F));
    EXPECT_TRUE(is_control(0x85));
    EXPECT_FALSE(is_control(U' '));
    EXPECT_FALSE(is_control(0xA0));

    EXPECT_FALSE(is_control_but_tab_cr_lf(U'\t'));
    EXPECT_FALSE(is_control_but_tab_cr_lf(U'\r'));
    EXPECT_FALSE(is_control_but_tab_cr_lf(U'\n'));
    EXPECT_TRUE(is_control_but_tab_cr_lf(0x1B));
}

TEST(StringHelpers, Trim) {
    EXPECT_EQ(trim("  a b \t"), "a b");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(StringHelpers, StripLineTerminator) {
    EXPECT_EQ(strip_line_terminator("abc\r\n"), "abc");
    EXPECT_EQ(strip_line_terminator("abc\n"), "abc");
    EXPECT_EQ(strip_line_terminator("abc  "), "abc  ");
}

TEST(StringHelpers, PrefixSuffix) {
    EXPECT_TRUE(starts_with("C\\64", "C"));
    EXPECT_FALSE(starts_with("", "C"));
    EXPECT_TRUE(ends_with("value\\", "\\"));
    EXPECT_FALSE(ends_with("v", "value"));
}
