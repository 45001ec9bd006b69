/*
 * test_storage_splicer.cpp - Unit tests for in-place tag region replacement
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
using namespace TagForge::IO;
using namespace TestFramework;
using namespace TagTestUtils;

// Audio stand-in that is easy to recognise after a move
static std::vector<uint8_t> payload(size_t size) {
    std::vector<uint8_t> out(size);
    for (size_t i = 0; i < size; ++i) {
        out[i] = static_cast<uint8_t>((i * 7 + 3) & 0xFF);
    }
    return out;
}

static std::vector<uint8_t> taggedFile(size_t padding, const std::vector<uint8_t>& audio) {
    std::vector<uint8_t> out = tag(3, {frame(3, "TIT2", latin1Text("Old title"))}, padding);
    append(out, audio);
    return out;
}

static std::vector<uint8_t> newTag(size_t padding) {
    return tag(4, {frame(4, "TIT2", latin1Text("New title")), frame(4, "TPE1", latin1Text("New artist"))}, padding);
}

static bool endsWith(const std::vector<uint8_t>& data, const std::vector<uint8_t>& tail) {
    return data.size() >= tail.size() && std::equal(tail.begin(), tail.end(), data.end() - tail.size());
}

// ============================================================================
// Locating the region
// ============================================================================

class Splicer_AbsentTagReportsNone : public TestCase {
public:
    Splicer_AbsentTagReportsNone() : TestCase("Splicer_AbsentTagReportsNone") {}
protected:
    void runTest() override {
        MemoryIOHandler empty;
        ASSERT_FALSE(StorageSplicer(empty).probe().has_value(), "empty store");

        MemoryIOHandler audio(payload(4096));
        ASSERT_FALSE(StorageSplicer(audio).probe().has_value(), "store without a tag");

        MemoryIOHandler future(header(5, 0, 100));
        ASSERT_FALSE(StorageSplicer(future).probe().has_value(), "ID3v2.5 is not a tag we own");

        MemoryIOHandler audio_again(payload(64));
        assertErrorKind([&] { StorageSplicer(audio_again).locate(); }, ErrorKind::NoTag, "locate without a tag");
    }
};

class Splicer_RegionBounds : public TestCase {
public:
    Splicer_RegionBounds() : TestCase("Splicer_RegionBounds") {}
protected:
    void runTest() override {
        MemoryIOHandler plain(taggedFile(100, payload(10)));
        StorageSplicer::Region region = StorageSplicer(plain).locate();
        ASSERT_EQUALS(3, static_cast<int>(region.major_version), "major version");
        ASSERT_FALSE(region.has_footer, "no footer");
        ASSERT_EQUALS(static_cast<off_t>(plain.data().size() - 10), region.end, "region ends before the payload");

        MemoryIOHandler footer(header(4, 0x10, 20));
        region = StorageSplicer(footer).locate();
        ASSERT_TRUE(region.has_footer, "footer flag");
        ASSERT_EQUALS(static_cast<off_t>(40), region.end, "footer counted");

        std::vector<uint8_t> corrupt = header(3, 0, 0);
        corrupt[8] = 0x80;
        MemoryIOHandler bad(corrupt);
        assertErrorKind([&] { StorageSplicer(bad).probe(); }, ErrorKind::Parsing, "size byte with the high bit set");
    }
};

class Splicer_ReadRegionTruncated : public TestCase {
public:
    Splicer_ReadRegionTruncated() : TestCase("Splicer_ReadRegionTruncated") {}
protected:
    void runTest() override {
        std::vector<uint8_t> data = header(4, 0, 100);
        data.resize(40, 0x00);
        MemoryIOHandler handler(data);
        StorageSplicer splicer(handler);
        StorageSplicer::Region region = splicer.locate();
        assertErrorKind([&] { splicer.readRegion(region); }, ErrorKind::Parsing, "store ends inside the tag");
    }
};

// ============================================================================
// Writing
// ============================================================================

class Splicer_GrowMovesPayload : public TestCase {
public:
    Splicer_GrowMovesPayload() : TestCase("Splicer_GrowMovesPayload") {}
protected:
    void runTest() override {
        std::vector<uint8_t> audio = payload(1000);
        MemoryIOHandler handler(taggedFile(0, audio));
        std::vector<uint8_t> replacement = newTag(300);

        StorageSplicer(handler).write(replacement);

        ASSERT_EQUALS(replacement.size() + audio.size(), handler.data().size(), "file grew by the difference");
        ASSERT_TRUE(std::equal(replacement.begin(), replacement.end(), handler.data().begin()), "new tag at the start");
        ASSERT_TRUE(endsWith(handler.data(), audio), "payload intact");
    }
};

class Splicer_ShrinkZeroFillsRegion : public TestCase {
public:
    Splicer_ShrinkZeroFillsRegion() : TestCase("Splicer_ShrinkZeroFillsRegion") {}
protected:
    void runTest() override {
        std::vector<uint8_t> audio = payload(500);
        std::vector<uint8_t> original = taggedFile(400, audio);
        size_t old_end = original.size() - audio.size();
        MemoryIOHandler handler(original);
        std::vector<uint8_t> replacement = newTag(0);

        StorageSplicer(handler).write(replacement);

        const std::vector<uint8_t>& result = handler.data();
        ASSERT_EQUALS(original.size(), result.size(), "file size unchanged");
        ASSERT_TRUE(std::equal(replacement.begin(), replacement.end(), result.begin()), "new tag at the start");
        ASSERT_TRUE(std::all_of(result.begin() + replacement.size(), result.begin() + old_end,
                                [](uint8_t b) { return b == 0x00; }), "rest of the old region zeroed");
        ASSERT_TRUE(endsWith(result, audio), "payload not moved");

        // The new tag still describes only its own bytes; the zeros read as padding
        Tag::ID3v2Tag decoded = Tag::TagCodec::readFrom(handler);
        ASSERT_EQUALS(std::string("New artist"), decoded.artist().value_or(""), "tag readable");
    }
};

class Splicer_ShrunkRegionIsReclaimed : public TestCase {
public:
    Splicer_ShrunkRegionIsReclaimed() : TestCase("Splicer_ShrunkRegionIsReclaimed") {}
protected:
    void runTest() override {
        std::vector<uint8_t> audio = payload(300);
        std::vector<uint8_t> original = taggedFile(400, audio);
        off_t old_end = static_cast<off_t>(original.size() - audio.size());
        MemoryIOHandler handler(original);

        Tag::ID3v2Tag small;
        small.setTitle("x");
        Tag::TagCodec::writeTo(handler, small);

        StorageSplicer::Region region = StorageSplicer(handler).locate();
        ASSERT_TRUE(region.declared_end < old_end, "header declares only the new tag");
        ASSERT_EQUALS(old_end, region.end, "zero fill counted into the region");

        // A tag that fits the old region reuses the zeros without moving the payload
        StorageSplicer(handler).write(newTag(0));
        ASSERT_EQUALS(original.size(), handler.data().size(), "file size unchanged");
        ASSERT_TRUE(endsWith(handler.data(), audio), "payload not moved");

        ASSERT_TRUE(Tag::TagCodec::removeFrom(handler), "tag removed");
        ASSERT_TRUE(handler.data() == audio, "only the payload remains");
    }
};

class Splicer_InsertIntoUntaggedStore : public TestCase {
public:
    Splicer_InsertIntoUntaggedStore() : TestCase("Splicer_InsertIntoUntaggedStore") {}
protected:
    void runTest() override {
        std::vector<uint8_t> audio = payload(2048);
        MemoryIOHandler handler(audio);
        std::vector<uint8_t> inserted = newTag(16);

        StorageSplicer(handler).write(inserted);

        ASSERT_EQUALS(inserted.size() + audio.size(), handler.data().size(), "tag prepended");
        ASSERT_TRUE(endsWith(handler.data(), audio), "payload follows the tag");
    }
};

class Splicer_PayloadLargerThanChunk : public TestCase {
public:
    Splicer_PayloadLargerThanChunk() : TestCase("Splicer_PayloadLargerThanChunk") {}
protected:
    void runTest() override {
        std::vector<uint8_t> audio = payload(StorageSplicer::CHUNK_SIZE * 2 + 12345);
        MemoryIOHandler handler(taggedFile(0, audio));
        StorageSplicer(handler).write(newTag(7));
        ASSERT_TRUE(endsWith(handler.data(), audio), "payload intact after a multi-chunk move");

        ASSERT_TRUE(StorageSplicer(handler).remove(), "tag removed");
        ASSERT_TRUE(handler.data() == audio, "only the payload remains");
    }
};

class Splicer_RemoveTag : public TestCase {
public:
    Splicer_RemoveTag() : TestCase("Splicer_RemoveTag") {}
protected:
    void runTest() override {
        std::vector<uint8_t> audio = payload(777);
        MemoryIOHandler handler(taggedFile(50, audio));
        ASSERT_TRUE(StorageSplicer(handler).remove(), "tag found");
        ASSERT_TRUE(handler.data() == audio, "payload moved to offset 0");
        ASSERT_FALSE(StorageSplicer(handler).remove(), "second remove finds nothing");
        ASSERT_TRUE(handler.data() == audio, "store untouched");
    }
};

class Splicer_WriteFailureIsIoError : public TestCase {
public:
    Splicer_WriteFailureIsIoError() : TestCase("Splicer_WriteFailureIsIoError") {}
protected:
    void runTest() override {
        MemoryIOHandler full(taggedFile(0, payload(100)));
        full.failWritesAfter(0);
        assertErrorKind([&] { StorageSplicer(full).write(newTag(0)); }, ErrorKind::Io, "first write refused");

        MemoryIOHandler later(taggedFile(0, payload(100)));
        later.failWritesAfter(1);
        assertErrorKind([&] { StorageSplicer(later).write(newTag(500)); }, ErrorKind::Io, "write after the move refused");

        MemoryIOHandler short_tag;
        assertErrorKind([&] { StorageSplicer(short_tag).write(bytes("ID3")); }, ErrorKind::Parsing,
                        "encoded tag shorter than a header");
    }
};

class Splicer_RealFile : public TestCase {
public:
    Splicer_RealFile() : TestCase("Splicer_RealFile") {}
protected:
    void runTest() override {
        std::vector<uint8_t> audio = payload(5000);
        TempFile file(taggedFile(10, audio));
        std::vector<uint8_t> replacement = newTag(1000);

        {
            File::FileIOHandler handler(file.path(), File::FileIOHandler::Mode::ReadWrite);
            StorageSplicer(handler).write(replacement);
            ASSERT_EQUALS(0, handler.close(), "close");
        }
        std::vector<uint8_t> grown = file.contents();
        ASSERT_EQUALS(replacement.size() + audio.size(), grown.size(), "file grew");
        ASSERT_TRUE(endsWith(grown, audio), "payload intact on disk");

        ASSERT_TRUE(Tag::TagCodec::removeFromPath(file.path()), "tag removed through the path helper");
        ASSERT_TRUE(file.contents() == audio, "only the payload remains on disk");

        assertErrorKind([] { File::FileIOHandler missing("/nonexistent/tagforge/file.mp3"); },
                        ErrorKind::Io, "opening a missing file");
    }
};

// ============================================================================
// Main
// ============================================================================

int main() {
    TestSuite suite("Storage Splicer Tests");

    suite.addTest(std::make_unique<Splicer_AbsentTagReportsNone>());
    suite.addTest(std::make_unique<Splicer_RegionBounds>());
    suite.addTest(std::make_unique<Splicer_ReadRegionTruncated>());

    suite.addTest(std::make_unique<Splicer_GrowMovesPayload>());
    suite.addTest(std::make_unique<Splicer_ShrinkZeroFillsRegion>());
    suite.addTest(std::make_unique<Splicer_ShrunkRegionIsReclaimed>());
    suite.addTest(std::make_unique<Splicer_InsertIntoUntaggedStore>());
    suite.addTest(std::make_unique<Splicer_PayloadLargerThanChunk>());
    suite.addTest(std::make_unique<Splicer_RemoveTag>());
    suite.addTest(std::make_unique<Splicer_WriteFailureIsIoError>());
    suite.addTest(std::make_unique<Splicer_RealFile>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
