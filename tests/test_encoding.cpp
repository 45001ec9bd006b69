/*
 * test_encoding.cpp - Unit and property tests for text encodings,
 *                     synchsafe integers and unsynchronisation
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tagforge.h"
#include "test_framework.h"
#include "tag_test_utils.h"

#ifdef HAVE_RAPIDCHECK
#include <rapidcheck.h>
#endif

using namespace TagForge;
using namespace TagForge::Tag;
using namespace TagForge::Core::Utility;
using namespace TestFramework;
using TagTestUtils::assertErrorKind;

static const std::vector<std::string> s_samples = {
    "",
    "Hello",
    "café",
    "日本語",
    "🎵🎶🎸",
    "Mixed: Hello 世界 🎵 café",
};

// ============================================================================
// Encoding Converter
// ============================================================================

class Encoding_RoundTripsEveryEncoding : public TestCase {
public:
    Encoding_RoundTripsEveryEncoding() : TestCase("Encoding_RoundTripsEveryEncoding") {}
protected:
    void runTest() override {
        for (const std::string& text : s_samples) {
            for (Encoding encoding : {Encoding::UTF16, Encoding::UTF16BE, Encoding::UTF8}) {
                std::vector<uint8_t> encoded = encodeString(text, encoding);
                ASSERT_EQUALS(text, decodeString(encoded.data(), encoded.size(), encoding),
                              std::string("round trip through ") + encodingName(encoding));
            }
        }
    }
};

class Encoding_Latin1RoundTrip : public TestCase {
public:
    Encoding_Latin1RoundTrip() : TestCase("Encoding_Latin1RoundTrip") {}
protected:
    void runTest() override {
        std::string text = "Ça va, señor? ÿ";
        std::vector<uint8_t> encoded = encodeString(text, Encoding::Latin1);
        ASSERT_EQUALS(15u, encoded.size(), "one byte per code point");
        ASSERT_EQUALS(0xC7, static_cast<int>(encoded[0]), "Ç is 0xC7");
        ASSERT_EQUALS(text, decodeString(encoded.data(), encoded.size(), Encoding::Latin1), "Latin1 round trip");
    }
};

class Encoding_Latin1RejectsWideCodepoints : public TestCase {
public:
    Encoding_Latin1RejectsWideCodepoints() : TestCase("Encoding_Latin1RejectsWideCodepoints") {}
protected:
    void runTest() override {
        ASSERT_FALSE(canEncode("日本語", Encoding::Latin1), "CJK is not Latin1");
        ASSERT_FALSE(canEncode("€", Encoding::Latin1), "the euro sign is above U+00FF");
        ASSERT_TRUE(canEncode("café", Encoding::Latin1), "é is Latin1");
        assertErrorKind([] { encodeString("日本語", Encoding::Latin1); }, ErrorKind::StringDecoding,
                        "encoding CJK as Latin1");
    }
};

class Encoding_UTF16WritesLittleEndianBOM : public TestCase {
public:
    Encoding_UTF16WritesLittleEndianBOM() : TestCase("Encoding_UTF16WritesLittleEndianBOM") {}
protected:
    void runTest() override {
        std::vector<uint8_t> encoded = encodeString("A", Encoding::UTF16);
        std::vector<uint8_t> expected = {0xFF, 0xFE, 'A', 0x00};
        ASSERT_TRUE(encoded == expected, "UTF-16 is BOM + little-endian units");

        std::vector<uint8_t> big_endian = {0xFE, 0xFF, 0x00, 'A'};
        ASSERT_EQUALS(std::string("A"), decodeString(big_endian.data(), big_endian.size(), Encoding::UTF16),
                      "a big-endian BOM is honoured");
    }
};

class Encoding_UTF16DecodeErrors : public TestCase {
public:
    Encoding_UTF16DecodeErrors() : TestCase("Encoding_UTF16DecodeErrors") {}
protected:
    void runTest() override {
        std::vector<uint8_t> no_bom = {'A', 0x00};
        assertErrorKind([&] { decodeString(no_bom.data(), no_bom.size(), Encoding::UTF16); },
                        ErrorKind::StringDecoding, "UTF-16 without a BOM");

        // Lone high surrogate
        std::vector<uint8_t> lone = {0xFF, 0xFE, 0x00, 0xD8};
        assertErrorKind([&] { decodeString(lone.data(), lone.size(), Encoding::UTF16); },
                        ErrorKind::StringDecoding, "unpaired surrogate");

        std::vector<uint8_t> bad_utf8 = {0xC3, 0x28};
        assertErrorKind([&] { decodeString(bad_utf8.data(), bad_utf8.size(), Encoding::UTF8); },
                        ErrorKind::StringDecoding, "invalid UTF-8");
    }
};

class Encoding_VersionRules : public TestCase {
public:
    Encoding_VersionRules() : TestCase("Encoding_VersionRules") {}
protected:
    void runTest() override {
        ASSERT_TRUE(isEncodingAllowed(Encoding::UTF8, Version::ID3v24), "UTF-8 is legal in v2.4");
        ASSERT_FALSE(isEncodingAllowed(Encoding::UTF8, Version::ID3v23), "UTF-8 is not legal in v2.3");
        ASSERT_FALSE(isEncodingAllowed(Encoding::UTF16BE, Version::ID3v22), "UTF-16BE is not legal in v2.2");
        ASSERT_EQUALS(Encoding::UTF16, encodingForVersion(Encoding::UTF8, Version::ID3v23),
                      "UTF-8 falls back to UTF-16 for v2.3");
        ASSERT_EQUALS(Encoding::Latin1, encodingForVersion(Encoding::Latin1, Version::ID3v22),
                      "Latin1 is kept for v2.2");
        assertErrorKind([] { encodingFromByte(4); }, ErrorKind::Parsing, "encoding byte 4");
    }
};

// ============================================================================
// Synchsafe integers
// ============================================================================

class Synchsafe_KnownValues : public TestCase {
public:
    Synchsafe_KnownValues() : TestCase("Synchsafe_KnownValues") {}
protected:
    void runTest() override {
        ASSERT_EQUALS(0x00000000u, ID3v2Utils::encodeSynchsafe(0), "zero");
        ASSERT_EQUALS(0x0000007Fu, ID3v2Utils::encodeSynchsafe(127), "127 fits one byte");
        ASSERT_EQUALS(0x00000100u, ID3v2Utils::encodeSynchsafe(128), "128 carries into the next byte");
        ASSERT_EQUALS(0x7F7F7F7Fu, ID3v2Utils::encodeSynchsafe(ID3v2Utils::MAX_SYNCHSAFE), "largest value");
        ASSERT_EQUALS(ID3v2Utils::MAX_SYNCHSAFE, ID3v2Utils::decodeSynchsafe(0x7F7F7F7F), "largest decode");

        uint8_t raw[4];
        ID3v2Utils::encodeSynchsafeBytes(1337, raw);
        ASSERT_EQUALS(1337u, ID3v2Utils::decodeSynchsafeBytes(raw), "byte form round trip");
    }
};

class Synchsafe_RejectsOutOfRange : public TestCase {
public:
    Synchsafe_RejectsOutOfRange() : TestCase("Synchsafe_RejectsOutOfRange") {}
protected:
    void runTest() override {
        ASSERT_FALSE(ID3v2Utils::canEncodeSynchsafe(0x10000000), "2^28 does not fit");
        assertErrorKind([] { ID3v2Utils::encodeSynchsafe(0x10000000); }, ErrorKind::Parsing, "encode 2^28");
        assertErrorKind([] { ID3v2Utils::decodeSynchsafe(0x00000080); }, ErrorKind::Parsing, "high bit in byte 0");
        assertErrorKind([] { ID3v2Utils::decodeSynchsafe(0x80000000); }, ErrorKind::Parsing, "high bit in byte 3");

        uint8_t raw[4] = {0x00, 0x00, 0x81, 0x00};
        assertErrorKind([&] { ID3v2Utils::decodeSynchsafeBytes(raw); }, ErrorKind::Parsing, "high bit in bytes");
    }
};

// ============================================================================
// Unsynchronisation
// ============================================================================

class Unsync_InsertsAfterFalseSync : public TestCase {
public:
    Unsync_InsertsAfterFalseSync() : TestCase("Unsync_InsertsAfterFalseSync") {}
protected:
    void runTest() override {
        std::vector<uint8_t> data = {0xFF, 0xE0, 0x12, 0xFF, 0x00, 0xFF, 0x7F};
        std::vector<uint8_t> expected = {0xFF, 0x00, 0xE0, 0x12, 0xFF, 0x00, 0x00, 0xFF, 0x7F};
        ASSERT_TRUE(ID3v2Utils::encodeUnsync(data.data(), data.size(), Version::ID3v23) == expected,
                    "zero inserted after FF E0 and FF 00 only");
        ASSERT_TRUE(ID3v2Utils::needsUnsync(data.data(), data.size(), Version::ID3v23), "false sync detected");

        std::vector<uint8_t> clean = {0x01, 0xFF, 0x7F};
        ASSERT_FALSE(ID3v2Utils::needsUnsync(clean.data(), clean.size(), Version::ID3v24), "no false sync");
    }
};

class Unsync_TrailingFFDependsOnVersion : public TestCase {
public:
    Unsync_TrailingFFDependsOnVersion() : TestCase("Unsync_TrailingFFDependsOnVersion") {}
protected:
    void runTest() override {
        std::vector<uint8_t> data = {0x41, 0xFF};
        ASSERT_EQUALS(3u, ID3v2Utils::encodeUnsync(data.data(), data.size(), Version::ID3v23).size(),
                      "v2.3 pads a final FF");
        ASSERT_EQUALS(2u, ID3v2Utils::encodeUnsync(data.data(), data.size(), Version::ID3v24).size(),
                      "v2.4 leaves a final FF alone");
    }
};

class Unsync_ApplyThenRemoveIsIdentity : public TestCase {
public:
    Unsync_ApplyThenRemoveIsIdentity() : TestCase("Unsync_ApplyThenRemoveIsIdentity") {}
protected:
    void runTest() override {
        // Deterministic pseudo-random buffers heavy in 0xFF and 0x00
        uint32_t state = 0x1234567;
        for (int round = 0; round < 200; ++round) {
            std::vector<uint8_t> data(static_cast<size_t>(round % 64));
            for (uint8_t& b : data) {
                state = state * 1103515245u + 12345u;
                uint8_t pick = static_cast<uint8_t>(state >> 24);
                b = (pick & 3) == 0 ? 0xFF : (pick & 3) == 1 ? 0x00 : pick;
            }
            for (Version version : {Version::ID3v23, Version::ID3v24}) {
                std::vector<uint8_t> encoded = ID3v2Utils::encodeUnsync(data.data(), data.size(), version);
                for (size_t i = 0; i + 1 < encoded.size(); ++i) {
                    ASSERT_FALSE(encoded[i] == 0xFF && encoded[i + 1] >= 0xE0, "encoded output has no false sync");
                }
                ASSERT_TRUE(ID3v2Utils::decodeUnsync(encoded.data(), encoded.size()) == data,
                            "remove(apply(x)) == x");
            }
        }
    }
};

#ifdef HAVE_RAPIDCHECK
// ============================================================================
// RapidCheck Property Tests
// ============================================================================

static void test_rapidcheck_properties() {
    std::cout << "\n=== RapidCheck Property Tests ===" << std::endl;

    bool ok = true;

    ok &= rc::check("synchsafe decode(encode(x)) == x", []() {
        uint32_t value = *rc::gen::inRange<uint32_t>(0, ID3v2Utils::MAX_SYNCHSAFE + 1);
        uint32_t encoded = ID3v2Utils::encodeSynchsafe(value);
        RC_ASSERT((encoded & 0x80808080u) == 0u);
        RC_ASSERT(ID3v2Utils::decodeSynchsafe(encoded) == value);
    });

    ok &= rc::check("unsync remove(apply(x)) == x", []() {
        std::vector<uint8_t> data = *rc::gen::container<std::vector<uint8_t>>(
            rc::gen::element<uint8_t>(0x00, 0xFF, 0xE0, 0x41));
        std::vector<uint8_t> encoded = ID3v2Utils::encodeUnsync(data.data(), data.size(), Version::ID3v23);
        RC_ASSERT(ID3v2Utils::decodeUnsync(encoded.data(), encoded.size()) == data);
    });

    ok &= rc::check("UTF-16 round trip", []() {
        std::string ascii = *rc::gen::container<std::string>(rc::gen::inRange(' ', '~'));
        std::vector<uint8_t> encoded = encodeString(ascii, Encoding::UTF16);
        RC_ASSERT(decodeString(encoded.data(), encoded.size(), Encoding::UTF16) == ascii);
    });

    if (!ok) {
        throw AssertionFailure("RapidCheck properties failed");
    }
}
#endif

// ============================================================================
// Main
// ============================================================================

int main() {
    TestSuite suite("Encoding, Synchsafe and Unsynchronisation Tests");

    suite.addTest(std::make_unique<Encoding_RoundTripsEveryEncoding>());
    suite.addTest(std::make_unique<Encoding_Latin1RoundTrip>());
    suite.addTest(std::make_unique<Encoding_Latin1RejectsWideCodepoints>());
    suite.addTest(std::make_unique<Encoding_UTF16WritesLittleEndianBOM>());
    suite.addTest(std::make_unique<Encoding_UTF16DecodeErrors>());
    suite.addTest(std::make_unique<Encoding_VersionRules>());

    suite.addTest(std::make_unique<Synchsafe_KnownValues>());
    suite.addTest(std::make_unique<Synchsafe_RejectsOutOfRange>());

    suite.addTest(std::make_unique<Unsync_InsertsAfterFalseSync>());
    suite.addTest(std::make_unique<Unsync_TrailingFFDependsOnVersion>());
    suite.addTest(std::make_unique<Unsync_ApplyThenRemoveIsIdentity>());

#ifdef HAVE_RAPIDCHECK
    suite.addTest("RapidCheck_Properties", test_rapidcheck_properties);
#else
    std::cout << "[SKIP] RapidCheck not available - skipping randomized tests" << std::endl;
#endif

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
