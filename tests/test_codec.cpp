/**
 * @file test_codec.cpp
 * @brief Unit tests for modifier encoding and decoding (GoogleTest)
 */

#include <gtest/gtest.h>
#include "plaincfg/Codec.hpp"
#include "plaincfg/Errors.hpp"
#include "plaincfg/Util.hpp"

#include <cmath>
#include <limits>
#include <memory>

using namespace plaincfg;

namespace {

CodecOptions unsafe_options() {
    CodecOptions o;
    o.safe = false;
    return o;
}

void expect_round_trip(const Value& v, const CodecOptions& options = {}) {
    const Encoded enc = encode_value(v, options);
    EXPECT_EQ(decode_value(enc.modifier, enc.payload, options), v)
        << "modifier '" << enc.modifier << "' payload '" << enc.payload << "'";
}

} // namespace

// ============================================================================
// Encoding: modifier selection
// ============================================================================

TEST(EncodeValue, PlainString) {
    const Encoded enc = encode_value(Value("localhost"));
    EXPECT_EQ(enc.modifier, "");
    EXPECT_EQ(enc.payload, "localhost");
}

TEST(EncodeValue, StringWithOtherControlsIsBase64) {
    const Encoded enc = encode_value(Value(std::string("a\0b", 3)));
    EXPECT_EQ(enc.modifier, "64s");
    EXPECT_EQ(enc.payload, "YQBi");
}

TEST(EncodeValue, StringWithLineBreaksIsLiteral) {
    const Encoded enc = encode_value(Value("line1\nline2\tend"));
    EXPECT_EQ(enc.modifier, "r");
    EXPECT_EQ(enc.payload, "'line1\\nline2\\tend'");
}

TEST(EncodeValue, MixedControlsPreferBase64) {
    const Encoded enc = encode_value(Value("tab\there\x07"));
    EXPECT_EQ(enc.modifier, "64s");
}

TEST(EncodeValue, Scalars) {
    EXPECT_EQ(encode_value(Value(true)).modifier, "r");
    EXPECT_EQ(encode_value(Value(true)).payload, "True");
    EXPECT_EQ(encode_value(Value()).payload, "None");

    const Encoded i = encode_value(Value(-42));
    EXPECT_EQ(i.modifier, "i");
    EXPECT_EQ(i.payload, "-42");

    const Encoded f = encode_value(Value(0.25));
    EXPECT_EQ(f.modifier, "f");
    EXPECT_EQ(f.payload, "0.25");
}

TEST(EncodeValue, BytesAreBase32) {
    const Encoded enc = encode_value(Value(Bytes{0x00, 0x01, 0xFF}));
    EXPECT_EQ(enc.modifier, "32");
    EXPECT_EQ(enc.payload, "AAA76===");
}

TEST(EncodeValue, LiteralContainers) {
    const Encoded enc = encode_value(Value(List{{1, "two", Tuple{{3.0}}}}));
    EXPECT_EQ(enc.modifier, "r");
    EXPECT_EQ(enc.payload, "[1, 'two', (3.0,)]");
}

TEST(EncodeValue, OpaqueRefusedInSafeMode) {
    const Value v(Opaque{"Widget", {{"id", 1}}});
    try {
        encode_value(v);
        FAIL() << "expected UnsafeValueError";
    } catch (const UnsafeValueError& e) {
        EXPECT_EQ(e.type_name(), "Widget");
    }
}

TEST(EncodeValue, ContainerWithOpaqueRefusedInSafeMode) {
    EXPECT_THROW(encode_value(Value(List{{Opaque{"Widget", nullptr}}})), UnsafeValueError);
}

TEST(EncodeValue, OpaqueSerializedInUnsafeMode) {
    const Encoded enc = encode_value(Value(Opaque{"Widget", {{"id", 1}}}), unsafe_options());
    EXPECT_EQ(enc.modifier, "64p");
    EXPECT_FALSE(enc.payload.empty());
}

TEST(EncodeValue, InvalidUtf8StringRejected) {
    EXPECT_THROW(encode_value(Value(std::string("\xff\xfe"))), EncodingError);
}

// ============================================================================
// Decoding: individual operations
// ============================================================================

TEST(DecodeValue, NoModifierIsString) {
    EXPECT_EQ(decode_value("", "hello = world"), Value("hello = world"));
}

TEST(DecodeValue, Integer) {
    EXPECT_EQ(decode_value("i", "42"), Value(42));
    EXPECT_EQ(decode_value("i", " -7 "), Value(-7));
    EXPECT_EQ(decode_value("i", "+5"), Value(5));
    EXPECT_THROW(decode_value("i", "4x"), FormatError);
    EXPECT_THROW(decode_value("i", ""), FormatError);
    EXPECT_THROW(decode_value("i", "99999999999999999999"), FormatError);
}

TEST(DecodeValue, Float) {
    EXPECT_EQ(decode_value("f", "2.5"), Value(2.5));
    EXPECT_EQ(decode_value("f", "-1e-3"), Value(-0.001));
    EXPECT_EQ(decode_value("f", "7"), Value(7.0));

    const Value inf = decode_value("f", "-Infinity");
    EXPECT_TRUE(std::isinf(inf.as_float()));
    EXPECT_LT(inf.as_float(), 0.0);
    EXPECT_TRUE(std::isnan(decode_value("f", "NaN").as_float()));

    EXPECT_THROW(decode_value("f", "abc"), FormatError);
    EXPECT_THROW(decode_value("f", "--1"), FormatError);
}

TEST(DecodeValue, Literal) {
    EXPECT_EQ(decode_value("r", "True"), Value(true));
    EXPECT_EQ(decode_value("r", "{'a': [1, 2]}"), Value(Dict{{"a", List{{1, 2}}}}));
    EXPECT_THROW(decode_value("r", "open('x')"), FormatError);
}

TEST(DecodeValue, Base32) {
    EXPECT_EQ(decode_value("32", "AAA76==="), Value(Bytes{0x00, 0x01, 0xFF}));
    EXPECT_THROW(decode_value("32", "not base32"), EncodingError);
}

TEST(DecodeValue, Base64ThenString) {
    EXPECT_EQ(decode_value("64s", "YQBi"), Value(std::string("a\0b", 3)));
    EXPECT_EQ(decode_value("64", "YQBi"), Value(to_bytes(std::string("a\0b", 3))));
    EXPECT_THROW(decode_value("64", "@@@@"), EncodingError);
}

TEST(DecodeValue, StringOfInvalidUtf8Fails) {
    // "//4=" is Base64 for FF FE
    EXPECT_THROW(decode_value("64s", "//4="), EncodingError);
}

TEST(DecodeValue, PlainInvalidUtf8Fails) {
    EXPECT_THROW(decode_value("", "caf\xe9"), EncodingError);
}

TEST(DecodeValue, BytesOperation) {
    EXPECT_EQ(decode_value("b", "abc"), Value(to_bytes("abc")));
    EXPECT_THROW(decode_value("ib", "1"), TypeMismatchError);
}

TEST(DecodeValue, StringOfInteger) {
    EXPECT_EQ(decode_value("is", "0042"), Value("42"));
}

TEST(DecodeValue, OperationsApplyLeftToRight) {
    // Base64 of "42", then integer
    EXPECT_EQ(decode_value("64i", "NDI="), Value(42));
    // Base32 of "[1]", then literal
    EXPECT_EQ(decode_value("32r", base32_encode(to_bytes("[1]"))), Value(List{{1}}));
}

TEST(DecodeValue, TextRequiredByParsers) {
    EXPECT_THROW(decode_value("ii", "1"), TypeMismatchError);
    EXPECT_THROW(decode_value("rf", "[1]"), TypeMismatchError);
    EXPECT_THROW(decode_value("i32", "1"), TypeMismatchError);
}

TEST(DecodeValue, UnknownModifier) {
    try {
        decode_value("ix", "1");
        FAIL() << "expected UnknownModifierError";
    } catch (const UnknownModifierError& e) {
        EXPECT_EQ(e.modifier(), "x");
    }
    EXPECT_THROW(decode_value("C\\", "x"), UnknownModifierError);
    EXPECT_THROW(decode_value("3", "x"), UnknownModifierError);
}

TEST(DecodeValue, DeserializeRefusedInSafeMode) {
    EXPECT_THROW(decode_value("64p", "AA=="), UnsafeOperationError);
}

TEST(DecodeValue, DeserializeGarbageIsFormatError) {
    EXPECT_THROW(decode_value("64p", "/w==", unsafe_options()), FormatError);
}

// ============================================================================
// Round trips
// ============================================================================

TEST(CodecRoundTrip, Scalars) {
    expect_round_trip(Value());
    expect_round_trip(Value(true));
    expect_round_trip(Value(false));
    expect_round_trip(Value(0));
    expect_round_trip(Value(std::numeric_limits<std::int64_t>::min()));
    expect_round_trip(Value(std::numeric_limits<std::int64_t>::max()));
    expect_round_trip(Value(0.1));
    expect_round_trip(Value(-1e300));
    expect_round_trip(Value(std::numeric_limits<double>::infinity()));
}

TEST(CodecRoundTrip, Strings) {
    expect_round_trip(Value(""));
    expect_round_trip(Value("  padded  "));
    expect_round_trip(Value("a=b/c#d"));
    expect_round_trip(Value("multi\nline\r\n\ttext"));
    expect_round_trip(Value(std::string("nul\0and\x1b", 8)));
    expect_round_trip(Value(u8"unicode é→\U0001F600"));
    expect_round_trip(Value(u8"c1 control \u0085"));
}

TEST(CodecRoundTrip, BytesAndContainers) {
    expect_round_trip(Value(Bytes{}));
    expect_round_trip(Value(Bytes{0xDE, 0xAD, 0xBE, 0xEF}));

    Set s;
    s.insert(Tuple{{1, "a"}});
    s.insert(2.5);
    expect_round_trip(Value(s));
    expect_round_trip(Value(Dict{{1, List{}}, {Tuple{}, Set{}}, {"k", Bytes{0x00}}}));
}

TEST(CodecRoundTrip, OpaqueInUnsafeMode) {
    const Value v(List{{Opaque{"Widget", {{"id", 7}, {"tags", {"a", "b"}}}}, 3}});
    expect_round_trip(v, unsafe_options());
}

TEST(CodecRoundTrip, NaNStaysNaN) {
    const Encoded enc = encode_value(Value(std::nan("")));
    EXPECT_EQ(enc.payload, "nan");
    EXPECT_TRUE(std::isnan(decode_value(enc.modifier, enc.payload).as_float()));
}

TEST(CodecRoundTrip, CustomSerializer) {
    struct FixedSerializer : ObjectSerializer {
        Bytes serialize(const Value&) const override { return to_bytes("ok"); }
        Value deserialize(const Bytes& data) const override { return Value(data); }
    };

    CodecOptions options = unsafe_options();
    options.serializer = std::make_shared<FixedSerializer>();

    const Encoded enc = encode_value(Value(Opaque{"Widget", nullptr}), options);
    EXPECT_EQ(enc.modifier, "64p");
    EXPECT_EQ(enc.payload, "b2s=");
    EXPECT_EQ(decode_value(enc.modifier, enc.payload, options), Value(to_bytes("ok")));
}
