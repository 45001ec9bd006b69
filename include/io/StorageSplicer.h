/*
 * StorageSplicer.h - In-place replacement of the tag region of a file
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGFORGE_IO_STORAGESPLICER_H
#define TAGFORGE_IO_STORAGESPLICER_H

// No direct includes - all includes should be in tagforge.h

namespace TagForge {
namespace IO {

/**
 * @brief Locates the ID3v2 region at the start of a store and replaces or
 *        removes it without rewriting more of the file than necessary
 *
 * The region is recomputed from the header on every call. Writing is not
 * transactional: a failure while the payload is being moved leaves the
 * file inconsistent. The ordering (extend, move payload, write frames,
 * write header) keeps the old header in place until the very last write.
 *
 * Every failed handler call is reported as Error(ErrorKind::Io).
 */
class StorageSplicer {
public:
    /// Bytes moved per read/write cycle when shifting the payload
    static constexpr size_t CHUNK_SIZE = 64 * 1024;

    /// ID3v2 header (and footer) size
    static constexpr size_t HEADER_SIZE = 10;

    struct Region {
        uint8_t major_version = 0;
        bool has_footer = false;
        off_t declared_end = 0; ///< 10 + declared size (+10 with a footer)
        off_t end = 0;          ///< declared_end plus any zero bytes that follow it
    };

    explicit StorageSplicer(IOHandler& handler);

    /**
     * @brief Find the tag region
     *
     * The region runs past the declared tag over any zero bytes that follow
     * it, so the fill left by a shrinking write() is reused or removed later.
     *
     * @throws Error NoTag when the store does not start with an ID3v2 header
     *         of major version 2, 3 or 4; Parsing for a corrupt size field
     */
    Region locate();

    /**
     * @brief Like locate(), but absence is reported as nullopt
     */
    std::optional<Region> probe();

    /**
     * @brief Read [0, region.end)
     * @throws Error Parsing if the store ends inside the region
     */
    std::vector<uint8_t> readRegion(const Region& region);

    /**
     * @brief Replace the tag region (or insert one) with an encoded tag
     *
     * A smaller tag is written over the old region and the rest of the
     * region is zero filled; bytes past the old region are untouched. A
     * larger tag first moves the payload towards the end of the file.
     *
     * @param tag Complete encoded tag, header first
     */
    void write(const std::vector<uint8_t>& tag);

    /**
     * @brief Remove the tag region, moving the payload to offset 0
     * @return false if there was no tag
     */
    bool remove();

private:
    off_t fileSize();
    // First offset at or after offset that holds a non-zero byte, or the end of the store
    off_t skipZeroRun(off_t offset);
    void readAt(off_t offset, uint8_t* buffer, size_t size);
    void writeAt(off_t offset, const uint8_t* buffer, size_t size);
    void truncateTo(off_t length);

    // Move [begin, end) to begin + delta, back to front
    void shiftTowardsEnd(off_t begin, off_t end, off_t delta);
    // Move [begin, end) to begin - delta, front to back
    void shiftTowardsStart(off_t begin, off_t end, off_t delta);

    [[noreturn]] void fail(const std::string& operation) const;

    IOHandler& m_handler;
};

} // namespace IO
} // namespace TagForge

#endif // TAGFORGE_IO_STORAGESPLICER_H
