#include <speakml/markup/entities.h>
#include <gtest/gtest.h>

using speakml::markup::decode_entities;
using speakml::markup::encode_entities;

TEST(Entities, DecodesSupportedReferences) {
    EXPECT_EQ(decode_entities("a &amp; b &lt; c &gt; d"), "a & b < c > d");
}

TEST(Entities, PlainTextUnchanged) {
    EXPECT_EQ(decode_entities("hello world"), "hello world");
    EXPECT_EQ(decode_entities(""), "");
}

TEST(Entities, DecodingHappensOnce) {
    EXPECT_EQ(decode_entities("&amp;lt;"), "&lt;");
    EXPECT_EQ(decode_entities("&amp;amp;"), "&amp;");
}

TEST(Entities, UnknownReferencesKeptVerbatim) {
    EXPECT_EQ(decode_entities("&quot;x&apos; &#65; &"), "&quot;x&apos; &#65; &");
    EXPECT_EQ(decode_entities("&lt"), "&lt");
}

TEST(Entities, EncodesAmpersandWithoutDoubleEscaping) {
    EXPECT_EQ(encode_entities("a < b"), "a &lt; b");
    EXPECT_EQ(encode_entities("x > y & z"), "x &gt; y &amp; z");
    EXPECT_EQ(encode_entities("&lt;"), "&amp;lt;");
}

TEST(Entities, EncodeThenDecodeRestoresText) {
    const std::string text = "if a<b && c>d then &amp;";
    EXPECT_EQ(decode_entities(encode_entities(text)), text);
}
