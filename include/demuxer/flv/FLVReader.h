/*
 * FLVReader.h - Sequential FLV header and tag reader
 * This file is part of FLVTag.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * FLVTag is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef FLVREADER_H
#define FLVREADER_H

// No direct includes - all includes should be in flvtag.h

namespace FLVTag {
namespace Demuxer {
namespace FLV {

/**
 * @brief Configuration for FLVReader
 */
struct FLVReaderOptions {
    size_t buffer_size;             // PeekReader read-ahead capacity
    uint32_t max_tag_size;          // Largest payload accepted
    bool strict_header_length;      // Reject a header length below 9

    FLVReaderOptions(size_t buffer = IO::PeekReader::DEFAULT_BUFFER_SIZE,
                     uint32_t max_tag = FLV_MAX_TAG_SIZE,
                     bool strict_header = false)
        : buffer_size(buffer), max_tag_size(max_tag),
          strict_header_length(strict_header) {}
};

/**
 * @brief Forward-only reader for FLV files
 *
 * Call readHeader() once, then readTag() until it throws
 * EndOfInputException. Each tag comes with a stream over its payload;
 * whatever the caller leaves unread is skipped on the next readTag(),
 * by seeking when the source allows it.
 */
class FLVReader {
public:
    explicit FLVReader(std::unique_ptr<IOHandler> source,
                       const FLVReaderOptions& options = FLVReaderOptions());

    /**
     * @brief Open a path, a file: URI or "-" (standard input)
     * @throws IOException if the file cannot be opened or the scheme is not file
     */
    static std::unique_ptr<FLVReader> open(const std::string& uri,
                                           const FLVReaderOptions& options = FLVReaderOptions());

    /**
     * @brief Read and validate the file header
     * @throws FormatException on a bad signature or version
     * @throws IOException if the input is shorter than a header
     * @throws std::logic_error if called more than once, or again after a
     *         failure
     */
    Header readHeader();

    /**
     * @brief Read the next tag header and grant its payload stream
     *
     * Invalidates the payload stream of the previous tag.
     * @throws EndOfInputException when no tags remain
     * @throws FormatException if the tag is larger than max_tag_size
     * @throws IOException on a truncated tag header or source failure
     * @throws std::logic_error if readHeader() has not succeeded
     */
    TagRecord readTag();

    bool isSeekable() const { return m_reader.isSeekable(); }

    // Logical offset of the next unread structure
    uint64_t offset() const { return m_reader.offset(); }

    size_t tagsRead() const { return m_tags_read; }

    const FLVReaderOptions& options() const { return m_options; }

private:
    enum class State {
        Start,
        TagLoop,
        Done,
        Failed      // readHeader() rejected the input
    };

    static std::string hexBytes(const uint8_t* data, size_t length);

    IO::PeekReader m_reader;
    FLVReaderOptions m_options;
    State m_state = State::Start;
    size_t m_tags_read = 0;
    size_t m_trailing_bytes = 0;    // Bytes left over when the input ended
};

} // namespace FLV
} // namespace Demuxer
} // namespace FLVTag

#endif // FLVREADER_H
