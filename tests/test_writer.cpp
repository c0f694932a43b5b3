/**
 * @file test_writer.cpp
 * @brief Unit tests for the structure-preserving writer (GoogleTest)
 */

#include <gtest/gtest.h>
#include "plaincfg/Writer.hpp"
#include "plaincfg/Parser.hpp"
#include "plaincfg/Errors.hpp"

#include <algorithm>
#include <sstream>

using namespace plaincfg;

// ============================================================================
// Fresh files
// ============================================================================

TEST(WriteConfig, FreshMappingInOrder) {
    Mapping m;
    m["host"] = "localhost";
    m["port"] = 42;
    m["debug"] = false;
    m["blob"] = Bytes{0x00, 0x01, 0xFF};
    EXPECT_EQ(write_config_string(m),
              "host=localhost\n"
              "port/i=42\n"
              "debug/r=False\n"
              "blob/32=AAA76===\n");
}

TEST(WriteConfig, EmptyMappingWritesNothing) {
    EXPECT_EQ(write_config_string(Mapping{}), "");
}

TEST(WriteConfig, RoundTripsThroughParser) {
    Mapping m;
    m["name"] = u8"Zoë";
    m["motd"] = "line one\nline two";
    m["raw"] = std::string("\x01\x02", 2);
    m["ratio"] = -0.125;
    m["nothing"] = Value();
    m["ports"] = List{{80, 443}};
    m["pair"] = Tuple{{"a", 1}};
    m["lookup"] = Dict{{"x", Set{}}, {2, Bytes{0x7F}}};
    m["long"] = std::string(400, 'y') + " and " + std::string(200, '\\');

    const ReadResult r = read_config_string(write_config_string(m));
    EXPECT_EQ(r.data.size(), m.size());
    for (const auto& kv : m) {
        ASSERT_EQ(r.data.count(kv.first), 1u) << kv.first;
        EXPECT_EQ(r.data.at(kv.first), kv.second) << kv.first;
    }
}

TEST(WriteConfig, LongValuesAreWrapped) {
    Mapping m;
    m["text"] = std::string(200, 'w');
    const std::string out = write_config_string(m);
    EXPECT_EQ(out.rfind("text/C\\=", 0), 0u);
    EXPECT_GT(std::count(out.begin(), out.end(), '\n'), 2);
}

TEST(WriteConfig, WidthOptionIsHonoured) {
    Mapping m;
    m["text"] = std::string(200, 'w');
    WriteOptions o;
    o.max_width = 0;
    EXPECT_EQ(write_config_string(m, {}, o), "text=" + std::string(200, 'w') + "\n");
}

// ============================================================================
// Structure preservation
// ============================================================================

TEST(WriteConfig, UpdatesInPlaceAndAppendsNewKeys) {
    const std::string original =
        "# Service settings\n"
        "port/i=1\n"
        "\n"
        "host=old.example\n";
    ReadResult r = read_config_string(original);
    r.data["port"] = 8080;
    r.data["tls"] = true;

    EXPECT_EQ(write_config_string(r.data, r.structure),
              "# Service settings\n"
              "port/i=8080\n"
              "\n"
              "host=old.example\n"
              "tls/r=True\n");
}

TEST(WriteConfig, UnchangedFileIsReproduced) {
    const std::string original =
        "# comment\n"
        "a=1\n"
        "   # indented comment\n"
        "b/i=2\n"
        "\n";
    const ReadResult r = read_config_string(original);
    EXPECT_EQ(write_config_string(r.data, r.structure), original);
}

TEST(WriteConfig, RemovedKeysAreDeleted) {
    ReadResult r = read_config_string("a=1\nb=2\nc=3\n");
    r.data.erase("b");
    EXPECT_EQ(write_config_string(r.data, r.structure), "a=1\nc=3\n");
}

TEST(WriteConfig, RewriteOldKeepsRemovedKeys) {
    ReadResult r = read_config_string("a=1\nb/i=2\nc=3\n");
    r.data.erase("b");
    WriteOptions o;
    o.rewrite_old = true;
    EXPECT_EQ(write_config_string(r.data, r.structure, o), "a=1\nb/i=2\nc=3\n");
}

TEST(WriteConfig, InvalidLinesAreDropped) {
    const ReadResult r = read_config_string("a=1\nnot a pair\nb/bogus=2\nc=3\n");
    EXPECT_EQ(write_config_string(r.data, r.structure), "a=1\nc=3\n");
}

TEST(WriteConfig, ContinuedRecordKeptVerbatimWithRewriteOld) {
    ReadResult r = read_config_string("k/C|=ab|\ncd\nz=1\n");
    r.data.erase("k");
    WriteOptions o;
    o.rewrite_old = true;
    EXPECT_EQ(write_config_string(r.data, r.structure, o), "k/C|=ab|\ncd\nz=1\n");
}

TEST(WriteConfig, CommentWithoutTerminatorGetsOne) {
    ReadResult r = read_config_string("# last line");
    r.data["k"] = "v";
    EXPECT_EQ(write_config_string(r.data, r.structure), "# last line\nk=v\n");
}

TEST(WriteConfig, EmptyKeySurvivesRewrite) {
    const std::string original = "=v\nport/i=1\n";
    const ReadResult r = read_config_string(original);
    ASSERT_EQ(r.data.count(""), 1u);
    EXPECT_EQ(write_config_string(r.data, r.structure), original);
}

TEST(WriteConfig, BlankKeysReadBackUnchanged) {
    Mapping m;
    m[""] = "empty";
    m["  "] = 2;
    const ReadResult r = read_config_string(write_config_string(m));
    ASSERT_EQ(r.data.size(), 2u);
    EXPECT_EQ(r.data.at(""), Value("empty"));
    EXPECT_EQ(r.data.at("  "), Value(2));
}

TEST(WriteConfig, DuplicateKeyWrittenOnce) {
    const ReadResult r = read_config_string("k=first\nk=second\n");
    EXPECT_EQ(write_config_string(r.data, r.structure), "k=second\n");
}

// ============================================================================
// Validation and atomicity
// ============================================================================

TEST(ValidateKey, RejectsUnrepresentableKeys) {
    EXPECT_THROW(validate_key("a=b"), InvalidKeyError);
    EXPECT_THROW(validate_key("a/b"), InvalidKeyError);
    EXPECT_THROW(validate_key("a\nb"), InvalidKeyError);
    EXPECT_THROW(validate_key("#hidden"), InvalidKeyError);
    EXPECT_THROW(validate_key("  #hidden"), InvalidKeyError);
    EXPECT_NO_THROW(validate_key("a.b-c_d"));
    EXPECT_NO_THROW(validate_key("with space"));
    EXPECT_NO_THROW(validate_key(""));
    EXPECT_NO_THROW(validate_key("   "));
    EXPECT_NO_THROW(validate_key(u8"clé"));
}

TEST(WriteConfig, InvalidKeyWritesNothing) {
    Mapping m;
    m["good"] = 1;
    m["bad=key"] = 2;

    std::ostringstream out;
    StreamLineSink sink(out);
    try {
        write_config(m, {}, sink);
        FAIL() << "expected InvalidKeyError";
    } catch (const InvalidKeyError& e) {
        EXPECT_EQ(e.key(), "bad=key");
    }
    EXPECT_TRUE(out.str().empty());
}

TEST(WriteConfig, UnsafeValueWritesNothing) {
    Mapping m;
    m["first"] = "ok";
    m["obj"] = Opaque{"Widget", {{"id", 3}}};

    StringLineSink sink;
    EXPECT_THROW(write_config(m, {}, sink), UnsafeValueError);
    EXPECT_TRUE(sink.str().empty());
}

TEST(WriteConfig, OpaqueRoundTripInUnsafeMode) {
    Mapping m;
    m["obj"] = Opaque{"Widget", {{"id", 3}, {"name", "gear"}}};

    WriteOptions wo;
    wo.safe = false;
    wo.max_width = 0;
    const std::string text = write_config_string(m, {}, wo);
    EXPECT_EQ(text.rfind("obj/64p=", 0), 0u);

    ReadOptions ro;
    ro.safe = false;
    const ReadResult r = read_config_string(text, ro);
    EXPECT_EQ(r.data.at("obj"), m.at("obj"));
}
