/*
 * test_id3v1v2.cpp - Unit tests for ID3v1, the genre table and the
 *                    combined ID3v1/ID3v2 operations
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

static void putText(std::vector<uint8_t>& data, size_t offset, const std::string& text) {
    std::copy(text.begin(), text.end(), data.begin() + offset);
}

// Raw 128-byte ID3v1 block
static std::vector<uint8_t> id3v1Block(const std::string& title, const std::string& year,
                                       uint8_t track, uint8_t genre) {
    std::vector<uint8_t> data(ID3v1Tag::TAG_SIZE, 0x00);
    putText(data, 0, "TAG");
    putText(data, 3, title);
    putText(data, 33, "Artist");
    putText(data, 63, "Album");
    putText(data, 93, year);
    putText(data, 97, "Comment");
    data[126] = track;
    data[127] = genre;
    return data;
}

// The file from the combined-tag scenario: v2.4 "Song", filler, ID3v1 "Trance"
static std::vector<uint8_t> songFile(std::vector<uint8_t>& filler) {
    std::vector<uint8_t> body = {0x03};
    append(body, bytes("Song"));
    std::vector<uint8_t> out = tag(4, {frame(4, "TIT2", body)});
    filler.assign(1337, 0xAA);
    append(out, filler);
    append(out, id3v1Block("Song v1", "1999", 0, 31));
    return out;
}

static bool contains(const std::vector<uint8_t>& data, const std::string& needle) {
    return std::search(data.begin(), data.end(), needle.begin(), needle.end()) != data.end();
}

// ============================================================================
// Genres
// ============================================================================

class Genres_Lookup : public TestCase {
public:
    Genres_Lookup() : TestCase("Genres_Lookup") {}
protected:
    void runTest() override {
        ASSERT_EQUALS(std::string("Blues"), Genres::name(0).value_or(""), "first entry");
        ASSERT_EQUALS(std::string("Trance"), Genres::name(31).value_or(""), "31");
        ASSERT_EQUALS(std::string("Psybient"), Genres::name(191).value_or(""), "last entry");
        ASSERT_FALSE(Genres::name(192).has_value(), "past the table");
        ASSERT_FALSE(Genres::name(-1).has_value(), "negative");
        ASSERT_EQUALS(31, Genres::index("trance").value_or(-1), "case-insensitive reverse lookup");
        ASSERT_FALSE(Genres::index("Not A Genre").has_value(), "unknown name");
    }
};

// ============================================================================
// ID3v1
// ============================================================================

class ID3v1_ParseV11 : public TestCase {
public:
    ID3v1_ParseV11() : TestCase("ID3v1_ParseV11") {}
protected:
    void runTest() override {
        std::vector<uint8_t> data = id3v1Block("Title   ", "2001", 7, 31);
        ID3v1Tag tag = ID3v1Tag::parse(data.data(), data.size());
        ASSERT_EQUALS(std::string("Title"), tag.title(), "trailing spaces trimmed");
        ASSERT_EQUALS(std::string("Artist"), tag.artist(), "artist");
        ASSERT_EQUALS(2001, tag.year().value_or(0), "year");
        ASSERT_TRUE(tag.isID3v1_1(), "track byte makes it v1.1");
        ASSERT_EQUALS(7, static_cast<int>(tag.track().value_or(0)), "track");
        ASSERT_EQUALS(std::string("Trance"), tag.genre().value_or(""), "genre name");

        std::vector<uint8_t> v10 = id3v1Block("Title", "abcd", 0, 255);
        ID3v1Tag plain = ID3v1Tag::parse(v10.data(), v10.size());
        ASSERT_FALSE(plain.isID3v1_1(), "zero track byte is v1.0");
        ASSERT_FALSE(plain.year().has_value(), "non-numeric year is unset");
        ASSERT_FALSE(plain.genre().has_value(), "genre 255 is unset");

        assertErrorKind([] { std::vector<uint8_t> junk(128, 'x'); ID3v1Tag::parse(junk.data(), junk.size()); },
                        ErrorKind::NoTag, "no TAG magic");
    }
};

class ID3v1_RenderLatin1 : public TestCase {
public:
    ID3v1_RenderLatin1() : TestCase("ID3v1_RenderLatin1") {}
protected:
    void runTest() override {
        ID3v1Tag tag;
        tag.setTitle("Café 日本");
        tag.setArtist(std::string(40, 'a'));
        tag.setYear(1984);
        tag.setTrack(12);
        tag.setGenreIndex(17);

        std::vector<uint8_t> data = tag.render();
        ASSERT_EQUALS(ID3v1Tag::TAG_SIZE, data.size(), "fixed size");
        ASSERT_EQUALS(0xE9, static_cast<int>(data[6]), "é as Latin1");
        ASSERT_EQUALS(static_cast<int>('?'), static_cast<int>(data[8]), "CJK replaced");
        ASSERT_EQUALS(static_cast<int>('a'), static_cast<int>(data[62]), "artist cut at 30 bytes");
        ASSERT_EQUALS(12, static_cast<int>(data[126]), "track byte");

        ID3v1Tag back = ID3v1Tag::parse(data.data(), data.size());
        ASSERT_EQUALS(std::string("Café ??"), back.title(), "title after the round trip");
        ASSERT_EQUALS(std::string("Rock"), back.genre().value_or(""), "genre 17");

        tag.setTitle(std::string("\xC3\x28", 2));
        assertErrorKind([&] { tag.render(); }, ErrorKind::StringDecoding, "invalid UTF-8 title");
    }
};

class ID3v1_ToID3v2 : public TestCase {
public:
    ID3v1_ToID3v2() : TestCase("ID3v1_ToID3v2") {}
protected:
    void runTest() override {
        std::vector<uint8_t> data = id3v1Block("Title", "2001", 3, 31);
        ID3v2Tag converted = ID3v1Tag::parse(data.data(), data.size()).toID3v2();
        ASSERT_EQUALS(std::string("Title"), converted.title().value_or(""), "title");
        ASSERT_EQUALS(std::string("Album"), converted.album().value_or(""), "album");
        ASSERT_EQUALS(2001, converted.year().value_or(0), "year");
        ASSERT_EQUALS(3u, converted.track().value_or(0), "track");
        ASSERT_EQUALS(std::string("Trance"), converted.genre().value_or(""), "genre by name");
        ASSERT_EQUALS(1u, converted.comments().size(), "comment");
        ASSERT_EQUALS(std::string("eng"), converted.comments()[0].lang, "comment language");
    }
};

class ID3v1_StoreOperations : public TestCase {
public:
    ID3v1_StoreOperations() : TestCase("ID3v1_StoreOperations") {}
protected:
    void runTest() override {
        std::vector<uint8_t> audio(300, 0x55);
        IO::MemoryIOHandler handler(audio);
        ASSERT_FALSE(ID3v1Tag::isCandidate(handler), "no tag yet");
        assertErrorKind([&] { ID3v1Tag::readFrom(handler); }, ErrorKind::NoTag, "read without a tag");

        ID3v1Tag tag;
        tag.setTitle("Appended");
        tag.writeTo(handler);
        ASSERT_EQUALS(audio.size() + ID3v1Tag::TAG_SIZE, handler.data().size(), "appended");

        tag.setTitle("Replaced");
        tag.writeTo(handler);
        ASSERT_EQUALS(audio.size() + ID3v1Tag::TAG_SIZE, handler.data().size(), "replaced in place");
        ASSERT_EQUALS(std::string("Replaced"), ID3v1Tag::readFrom(handler).title(), "new title");

        ASSERT_TRUE(ID3v1Tag::removeFrom(handler), "removed");
        ASSERT_TRUE(handler.data() == audio, "audio untouched");
        ASSERT_FALSE(ID3v1Tag::removeFrom(handler), "nothing left to remove");

        IO::MemoryIOHandler tiny(std::vector<uint8_t>(10, 0x00));
        ASSERT_FALSE(ID3v1Tag::isCandidate(tiny), "store smaller than a tag");
    }
};

// ============================================================================
// Combined operations
// ============================================================================

class Combined_SongScenario : public TestCase {
public:
    Combined_SongScenario() : TestCase("Combined_SongScenario") {}
protected:
    void runTest() override {
        std::vector<uint8_t> filler;
        IO::MemoryIOHandler handler(songFile(filler));

        ASSERT_EQUALS(ID3v1v2::FormatVersion::Both, ID3v1v2::isCandidate(handler), "both formats detected");

        ID3v2Tag tag = ID3v1v2::readFrom(handler);
        ASSERT_EQUALS(std::string("Song"), tag.title().value_or(""), "ID3v2 preferred");
        ASSERT_EQUALS(Version::ID3v24, tag.version(), "v2.4 tag");

        ASSERT_EQUALS(ID3v1v2::FormatVersion::Both, ID3v1v2::removeFrom(handler), "both were present");
        ASSERT_TRUE(handler.data() == filler, "only the filler remains");
        ASSERT_FALSE(contains(handler.data(), "ID3"), "no ID3v2 magic");
        ASSERT_FALSE(contains(handler.data(), "TAG"), "no ID3v1 magic");
        ASSERT_EQUALS(ID3v1v2::FormatVersion::None, ID3v1v2::isCandidate(handler), "nothing detected");
        ASSERT_EQUALS(ID3v1v2::FormatVersion::None, ID3v1v2::removeFrom(handler), "nothing removed");
    }
};

class Combined_FallsBackToID3v1 : public TestCase {
public:
    Combined_FallsBackToID3v1() : TestCase("Combined_FallsBackToID3v1") {}
protected:
    void runTest() override {
        std::vector<uint8_t> data(500, 0xAA);
        append(data, id3v1Block("Only v1", "1999", 0, 31));
        IO::MemoryIOHandler handler(data);

        ASSERT_EQUALS(ID3v1v2::FormatVersion::ID3v1, ID3v1v2::isCandidate(handler), "ID3v1 only");
        ID3v2Tag tag = ID3v1v2::readFrom(handler);
        ASSERT_EQUALS(std::string("Only v1"), tag.title().value_or(""), "converted title");
        ASSERT_EQUALS(std::string("Trance"), tag.genreParsed().value_or(""), "converted genre");

        IO::MemoryIOHandler bare(std::vector<uint8_t>(500, 0xAA));
        assertErrorKind([&] { ID3v1v2::readFrom(bare); }, ErrorKind::NoTag, "neither tag present");
    }
};

class Combined_WriteClearsID3v1 : public TestCase {
public:
    Combined_WriteClearsID3v1() : TestCase("Combined_WriteClearsID3v1") {}
protected:
    void runTest() override {
        std::vector<uint8_t> filler;
        TempFile file(songFile(filler));

        ID3v2Tag tag = ID3v1v2::readFromPath(file.path());
        tag.setArtist("High Contrast");
        ID3v1v2::writeToPath(file.path(), tag, tag.version());

        ID3v2Tag reread = ID3v1v2::readFromPath(file.path());
        ASSERT_EQUALS(std::string("High Contrast"), reread.artist().value_or(""), "artist written");
        ASSERT_EQUALS(std::string("Song"), reread.title().value_or(""), "title kept");
        ASSERT_EQUALS(ID3v1v2::FormatVersion::ID3v2, ID3v1v2::isCandidatePath(file.path()), "ID3v1 removed");
        ASSERT_TRUE(endsWith(file.contents(), filler), "filler intact");
    }

private:
    static bool endsWith(const std::vector<uint8_t>& data, const std::vector<uint8_t>& tail) {
        return data.size() >= tail.size() && std::equal(tail.begin(), tail.end(), data.end() - tail.size());
    }
};

class Combined_WriteToHandlerInVersion : public TestCase {
public:
    Combined_WriteToHandlerInVersion() : TestCase("Combined_WriteToHandlerInVersion") {}
protected:
    void runTest() override {
        std::vector<uint8_t> filler;
        IO::MemoryIOHandler handler(songFile(filler));

        ID3v2Tag tag = ID3v1v2::readFrom(handler);
        tag.setAlbum("Remixed");
        ID3v1v2::writeTo(handler, tag, Version::ID3v23);

        ASSERT_EQUALS(ID3v1v2::FormatVersion::ID3v2, ID3v1v2::isCandidate(handler), "ID3v1 removed");
        ID3v2Tag reread = TagCodec::readFrom(handler);
        ASSERT_EQUALS(Version::ID3v23, reread.version(), "written as ID3v2.3");
        ASSERT_EQUALS(std::string("Remixed"), reread.album().value_or(""), "album written");
        ASSERT_EQUALS(std::string("Song"), reread.title().value_or(""), "title kept");
    }
};

class Combined_CorruptID3v2IsNotHidden : public TestCase {
public:
    Combined_CorruptID3v2IsNotHidden() : TestCase("Combined_CorruptID3v2IsNotHidden") {}
protected:
    void runTest() override {
        std::vector<uint8_t> data = tag(4, {encryptedFrame()});
        append(data, id3v1Block("Fallback", "1999", 0, 31));
        IO::MemoryIOHandler handler(data);
        assertErrorKind([&] { ID3v1v2::readFrom(handler); }, ErrorKind::UnsupportedFeature,
                        "ID3v2 failure is reported, not replaced by ID3v1");
    }

private:
    static std::vector<uint8_t> encryptedFrame() {
        std::vector<uint8_t> body = {0x80, 0x00};
        return frame(4, "TIT2", body, FrameCodec::V24_ENCRYPTION);
    }
};

// ============================================================================
// Main
// ============================================================================

int main() {
    TestSuite suite("ID3v1 and Combined Tag Tests");

    suite.addTest(std::make_unique<Genres_Lookup>());

    suite.addTest(std::make_unique<ID3v1_ParseV11>());
    suite.addTest(std::make_unique<ID3v1_RenderLatin1>());
    suite.addTest(std::make_unique<ID3v1_ToID3v2>());
    suite.addTest(std::make_unique<ID3v1_StoreOperations>());

    suite.addTest(std::make_unique<Combined_SongScenario>());
    suite.addTest(std::make_unique<Combined_FallsBackToID3v1>());
    suite.addTest(std::make_unique<Combined_WriteClearsID3v1>());
    suite.addTest(std::make_unique<Combined_WriteToHandlerInVersion>());
    suite.addTest(std::make_unique<Combined_CorruptID3v2IsNotHidden>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
