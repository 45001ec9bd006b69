/*
 * test_content_codec.cpp - Unit tests for frame body layouts and the
 *                          frame identifier table
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tagforge.h"
#include "test_framework.h"
#include "tag_test_utils.h"

using namespace TagForge;
using namespace TagForge::Tag;
using namespace TestFramework;
using namespace TagTestUtils;

// Encode then decode one payload under a frame identifier
static Content roundTrip(const std::string& id, const Content& content, Version version, Encoding encoding) {
    std::vector<uint8_t> body = ContentCodec::encode(content, version, encoding);
    return ContentCodec::decode(id, version, body.data(), body.size()).content;
}

static const Version s_versions[] = {Version::ID3v22, Version::ID3v23, Version::ID3v24};

// ============================================================================
// Frame identifier table
// ============================================================================

class Registry_LegacyMapping : public TestCase {
public:
    Registry_LegacyMapping() : TestCase("Registry_LegacyMapping") {}
protected:
    void runTest() override {
        ASSERT_EQUALS(std::string("TIT2"), FrameRegistry::canonicalFromLegacy("TT2").value_or(""), "TT2 -> TIT2");
        ASSERT_EQUALS(std::string("APIC"), FrameRegistry::canonicalFromLegacy("PIC").value_or(""), "PIC -> APIC");
        ASSERT_EQUALS(std::string("COM"), FrameRegistry::legacyFromCanonical("COMM").value_or(""), "COMM -> COM");
        ASSERT_FALSE(FrameRegistry::canonicalFromLegacy("ZZZ").has_value(), "unknown v2.2 identifier");
    }
};

class Registry_ShapesAndRules : public TestCase {
public:
    Registry_ShapesAndRules() : TestCase("Registry_ShapesAndRules") {}
protected:
    void runTest() override {
        ASSERT_EQUALS(ContentShape::Text, FrameRegistry::contentShape("TIT2"), "TIT2 is text");
        ASSERT_EQUALS(ContentShape::ExtendedText, FrameRegistry::contentShape("TXXX"), "TXXX");
        ASSERT_EQUALS(ContentShape::Timestamp, FrameRegistry::contentShape("TDRC"), "TDRC");
        ASSERT_EQUALS(ContentShape::Text, FrameRegistry::contentShape("TZZZ"),
                      "unknown T*** falls back to text");
        ASSERT_EQUALS(ContentShape::Link, FrameRegistry::contentShape("WZZZ"),
                      "unknown W*** falls back to link");
        ASSERT_EQUALS(ContentShape::Unknown, FrameRegistry::contentShape("PRIV"),
                      "PRIV is carried as raw bytes");

        ASSERT_TRUE(FrameRegistry::isSingular("TIT2"), "TIT2 is singular");
        ASSERT_FALSE(FrameRegistry::isSingular("COMM"), "COMM repeats");
        ASSERT_TRUE(FrameRegistry::isV24Only("TDRC"), "TDRC arrived in v2.4");
        ASSERT_FALSE(FrameRegistry::isV24Only("TYER"), "TYER is v2.3");

        ASSERT_TRUE(FrameRegistry::isValidFrameId("TIT2", Version::ID3v24), "TIT2 is well formed");
        ASSERT_FALSE(FrameRegistry::isValidFrameId("TT2", Version::ID3v24), "3 characters in v2.4");
        ASSERT_FALSE(FrameRegistry::isValidFrameId("tit2", Version::ID3v24), "lower case");
        ASSERT_TRUE(FrameRegistry::isValidFrameId("TT2", Version::ID3v22), "TT2 is well formed in v2.2");
    }
};

// ============================================================================
// Body layouts
// ============================================================================

class Content_TextMultipleValues : public TestCase {
public:
    Content_TextMultipleValues() : TestCase("Content_TextMultipleValues") {}
protected:
    void runTest() override {
        Text text{{"Artist A", "Artist B"}};
        std::vector<uint8_t> body = ContentCodec::encode(text, Version::ID3v24, Encoding::Latin1);
        std::vector<uint8_t> expected = latin1Text(std::string("Artist A\0Artist B", 17));
        ASSERT_TRUE(body == expected, "values are null separated");

        ContentCodec::Decoded decoded = ContentCodec::decode("TPE1", Version::ID3v24, body.data(), body.size());
        ASSERT_TRUE(decoded.content == Content(text), "both values come back");
        ASSERT_EQUALS(Encoding::Latin1, decoded.encoding.value_or(Encoding::UTF8), "declared encoding reported");
    }
};

class Content_TextTrailingTerminatorTolerated : public TestCase {
public:
    Content_TextTrailingTerminatorTolerated() : TestCase("Content_TextTrailingTerminatorTolerated") {}
protected:
    void runTest() override {
        std::vector<uint8_t> body = latin1Text(std::string("Title\0", 6));
        ContentCodec::Decoded decoded = ContentCodec::decode("TIT2", Version::ID3v23, body.data(), body.size());
        const Text* text = std::get_if<Text>(&decoded.content);
        ASSERT_NOT_NULL(text, "decoded as text");
        ASSERT_EQUALS(1u, text->values.size(), "the terminator does not add an empty value");
        ASSERT_EQUALS(std::string("Title"), text->values[0], "value");
    }
};

class Content_TextEmptyLastValueSurvives : public TestCase {
public:
    Content_TextEmptyLastValueSurvives() : TestCase("Content_TextEmptyLastValueSurvives") {}
protected:
    void runTest() override {
        std::vector<uint8_t> body = ContentCodec::encode(Text{{"a", ""}}, Version::ID3v24, Encoding::Latin1);
        std::vector<uint8_t> expected = {0x00, 'a', 0x00, 0x00};
        ASSERT_TRUE(body == expected, "extra terminator after an empty last value");

        const std::vector<Text> cases = {
            Text{{"a", ""}},
            Text{{"", ""}},
            Text{{"a", "", ""}},
            Text{{"a", "", "b"}},
        };
        const Encoding encodings[] = {Encoding::Latin1, Encoding::UTF8, Encoding::UTF16};
        for (Encoding encoding : encodings) {
            for (const Text& text : cases) {
                Content back = roundTrip("TPE1", text, Version::ID3v24, encoding);
                ASSERT_TRUE(back == Content(text), std::string(encodingName(encoding)) + " keeps " +
                            std::to_string(text.values.size()) + " values, got " + describeContent(back));
            }
        }
    }
};

class Content_RoundTripsAcrossVersions : public TestCase {
public:
    Content_RoundTripsAcrossVersions() : TestCase("Content_RoundTripsAcrossVersions") {}
protected:
    void runTest() override {
        Picture picture;
        picture.mime_type = "image/png";
        picture.picture_type = PictureType::FrontCover;
        picture.description = "Cover";
        picture.data = {0x89, 'P', 'N', 'G', 0x00, 0xFF};

        const std::vector<std::pair<std::string, Content>> cases = {
            {"TIT2", Text{{"Ünïcödé title 日本"}}},
            {"TXXX", ExtendedText{"MusicBrainz Album Id", "0d7e9e4c"}},
            {"WOAR", Link{"https://example.com/artist"}},
            {"WXXX", ExtendedLink{"Home", "https://example.com"}},
            {"COMM", Comment{"eng", "desc", "A comment"}},
            {"USLT", Lyrics{"deu", "", "Zeile eins\nZeile zwei"}},
            {"APIC", picture},
            {"POPM", Popularimeter{"user@example.com", 196, 42}},
            {"PRIV", Unknown{{0x00, 0x01, 0xFF}}},
        };

        for (Version version : s_versions) {
            for (const auto& c : cases) {
                Content back = roundTrip(c.first, c.second, version, Encoding::UTF16);
                ASSERT_TRUE(back == c.second,
                            c.first + " survives " + versionName(version) + " as " + describeContent(back));
            }
        }

        Content timestamp = Timestamp::parse("2015-07-14T09:30");
        ASSERT_TRUE(roundTrip("TDRC", timestamp, Version::ID3v24, Encoding::UTF8) == timestamp, "TDRC");
    }
};

class Content_V22PictureUsesImageFormat : public TestCase {
public:
    Content_V22PictureUsesImageFormat() : TestCase("Content_V22PictureUsesImageFormat") {}
protected:
    void runTest() override {
        Picture picture;
        picture.mime_type = "image/jpeg";
        picture.picture_type = PictureType::FrontCover;
        picture.data = {0xFF, 0xD8};

        std::vector<uint8_t> body = ContentCodec::encode(picture, Version::ID3v22, Encoding::Latin1);
        std::vector<uint8_t> expected = {0x00, 'J', 'P', 'G', 0x03, 0x00, 0xFF, 0xD8};
        ASSERT_TRUE(body == expected, "PIC layout: encoding, format, type, description, data");

        ASSERT_EQUALS(std::string("image/png"), ContentCodec::mimeFromFormat("PNG"), "PNG");
        ASSERT_EQUALS(std::string("JPG"), ContentCodec::formatFromMime("image/jpg"), "image/jpg");
    }
};

class Content_PopularimeterCounterWidth : public TestCase {
public:
    Content_PopularimeterCounterWidth() : TestCase("Content_PopularimeterCounterWidth") {}
protected:
    void runTest() override {
        std::vector<uint8_t> body = ContentCodec::encode(Popularimeter{"a", 255, 0}, Version::ID3v24, Encoding::Latin1);
        std::vector<uint8_t> expected = {'a', 0x00, 0xFF, 0x00, 0x00, 0x00, 0x00};
        ASSERT_TRUE(body == expected, "counter is at least 4 bytes");

        std::vector<uint8_t> zero_led = {'a', 0x00, 0x01, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0x01, 0x02};
        ContentCodec::Decoded decoded = ContentCodec::decode("POPM", Version::ID3v24, zero_led.data(), zero_led.size());
        const Popularimeter* popm = std::get_if<Popularimeter>(&decoded.content);
        ASSERT_NOT_NULL(popm, "decoded as POPM");
        ASSERT_EQUALS(static_cast<uint64_t>(0x0102), popm->counter, "leading zero bytes do not count towards the width");

        std::vector<uint8_t> too_wide = {'a', 0x00, 0x01, 1, 2, 3, 4, 5, 6, 7, 8, 9};
        assertErrorKind([&] { ContentCodec::decode("POPM", Version::ID3v24, too_wide.data(), too_wide.size()); },
                        ErrorKind::Parsing, "counter wider than 64 bits");
    }
};

class Content_MalformedBodies : public TestCase {
public:
    Content_MalformedBodies() : TestCase("Content_MalformedBodies") {}
protected:
    void runTest() override {
        std::vector<uint8_t> empty;
        assertErrorKind([&] { ContentCodec::decode("TIT2", Version::ID3v24, empty.data(), 0); },
                        ErrorKind::Parsing, "text frame without an encoding byte");

        std::vector<uint8_t> short_comment = {0x00, 'e', 'n'};
        assertErrorKind([&] { ContentCodec::decode("COMM", Version::ID3v24, short_comment.data(), short_comment.size()); },
                        ErrorKind::Parsing, "comment cut inside the language");

        std::vector<uint8_t> unterminated = {0x00, 'd', 'e', 's', 'c'};
        assertErrorKind([&] { ContentCodec::decode("TXXX", Version::ID3v24, unterminated.data(), unterminated.size()); },
                        ErrorKind::Parsing, "TXXX description without terminator");

        std::vector<uint8_t> bad_date = latin1Text("July 2015");
        assertErrorKind([&] { ContentCodec::decode("TDRC", Version::ID3v24, bad_date.data(), bad_date.size()); },
                        ErrorKind::Parsing, "TDRC that is not a timestamp");
    }
};

class Content_EncodeRejections : public TestCase {
public:
    Content_EncodeRejections() : TestCase("Content_EncodeRejections") {}
protected:
    void runTest() override {
        assertErrorKind([] { ContentCodec::encode(Text{{"x"}}, Version::ID3v23, Encoding::UTF8); },
                        ErrorKind::UnsupportedFeature, "UTF-8 in v2.3");
        assertErrorKind([] { ContentCodec::encode(Comment{"english", "", "x"}, Version::ID3v24, Encoding::UTF8); },
                        ErrorKind::Parsing, "language longer than 3 characters");
        assertErrorKind([] { ContentCodec::encode(Text{{"日本"}}, Version::ID3v24, Encoding::Latin1); },
                        ErrorKind::StringDecoding, "CJK text as Latin1");
    }
};

class Timestamp_ParseAndFormat : public TestCase {
public:
    Timestamp_ParseAndFormat() : TestCase("Timestamp_ParseAndFormat") {}
protected:
    void runTest() override {
        for (const char* text : {"2015", "2015-07", "2015-07-14", "2015-07-14T09", "2015-07-14T09:30",
                                 "2015-07-14T09:30:05"}) {
            ASSERT_EQUALS(std::string(text), Timestamp::parse(text).toString(), "round trip of " + std::string(text));
        }
        ASSERT_FALSE(Timestamp::tryParse("2015-13").has_value(), "month 13");
        ASSERT_FALSE(Timestamp::tryParse("15").has_value(), "two-digit year");
        ASSERT_FALSE(Timestamp::tryParse("2015-07-14 09:30").has_value(), "space separator");
    }
};

// ============================================================================
// Main
// ============================================================================

int main() {
    TestSuite suite("Content Codec Tests");

    suite.addTest(std::make_unique<Registry_LegacyMapping>());
    suite.addTest(std::make_unique<Registry_ShapesAndRules>());

    suite.addTest(std::make_unique<Content_TextMultipleValues>());
    suite.addTest(std::make_unique<Content_TextTrailingTerminatorTolerated>());
    suite.addTest(std::make_unique<Content_TextEmptyLastValueSurvives>());
    suite.addTest(std::make_unique<Content_RoundTripsAcrossVersions>());
    suite.addTest(std::make_unique<Content_V22PictureUsesImageFormat>());
    suite.addTest(std::make_unique<Content_PopularimeterCounterWidth>());
    suite.addTest(std::make_unique<Content_MalformedBodies>());
    suite.addTest(std::make_unique<Content_EncodeRejections>());

    suite.addTest(std::make_unique<Timestamp_ParseAndFormat>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
