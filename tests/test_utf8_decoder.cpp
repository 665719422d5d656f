#include <gtest/gtest.h>
#include <core/utf8_decoder.hpp>

static const std::string FFFD = Utf8Decoder::replacement();

TEST(Utf8Decoder, AsciiPassesThrough) {
    Utf8Decoder d;
    EXPECT_EQ(d.feed("ls -la\r\n"), "ls -la\r\n");
    EXPECT_FALSE(d.has_pending());
}

TEST(Utf8Decoder, MultibyteIntact) {
    Utf8Decoder d;
    EXPECT_EQ(d.feed("h\xC3\xA9llo \xE2\x82\xAC \xF0\x9F\x98\x80"),
              "h\xC3\xA9llo \xE2\x82\xAC \xF0\x9F\x98\x80");
}

TEST(Utf8Decoder, CharacterSplitAcrossReads) {
    Utf8Decoder d;
    // U+20AC split after its first byte
    EXPECT_EQ(d.feed("price: \xE2"), "price: ");
    EXPECT_TRUE(d.has_pending());
    EXPECT_EQ(d.feed("\x82\xAC!"), "\xE2\x82\xAC!");
    EXPECT_FALSE(d.has_pending());
}

TEST(Utf8Decoder, FourByteSplitThreeWays) {
    Utf8Decoder d;
    EXPECT_EQ(d.feed("\xF0"), "");
    EXPECT_EQ(d.feed("\x9F\x98"), "");
    EXPECT_EQ(d.feed("\x80"), "\xF0\x9F\x98\x80");
}

TEST(Utf8Decoder, InvalidByteReplaced) {
    Utf8Decoder d;
    EXPECT_EQ(d.feed("a\xFF" "b"), "a" + FFFD + "b");
}

TEST(Utf8Decoder, StrayContinuationReplaced) {
    Utf8Decoder d;
    EXPECT_EQ(d.feed("\x80x"), FFFD + "x");
}

TEST(Utf8Decoder, OverlongIsTwoReplacements) {
    Utf8Decoder d;
    EXPECT_EQ(d.feed("\xC0\xAF"), FFFD + FFFD);
}

TEST(Utf8Decoder, TruncatedSequenceThenAscii) {
    Utf8Decoder d;
    // E2 82 is a valid prefix; 'A' ends it early: one replacement, 'A' kept
    EXPECT_EQ(d.feed("\xE2\x82" "A"), FFFD + "A");
}

TEST(Utf8Decoder, SurrogateRejected) {
    Utf8Decoder d;
    std::string out = d.feed("\xED\xA0\x80");
    EXPECT_EQ(out.find("\xED"), std::string::npos);
    EXPECT_EQ(out.substr(0, FFFD.size()), FFFD);
}

TEST(Utf8Decoder, FlushDanglingPartial) {
    Utf8Decoder d;
    EXPECT_EQ(d.feed("ok\xE2\x82"), "ok");
    EXPECT_EQ(d.flush(), FFFD);
    EXPECT_EQ(d.flush(), "");
    EXPECT_EQ(d.feed("x"), "x");
}

TEST(Utf8Decoder, ByteAtATime) {
    Utf8Decoder d;
    const std::string text = "na\xC3\xAFve \xE6\x97\xA5\xE6\x9C\xAC";
    std::string out;
    for (char c : text) out += d.feed(&c, 1);
    EXPECT_EQ(out, text);
}
