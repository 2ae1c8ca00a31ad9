/*
 * FLVReader.cpp - Sequential FLV header and tag reader
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

#include "flvtag.h"

namespace FLVTag {
namespace Demuxer {
namespace FLV {

using namespace Core::Utility::ByteOrder;

FLVReader::FLVReader(std::unique_ptr<IOHandler> source, const FLVReaderOptions& options)
    : m_reader(std::move(source), options.buffer_size), m_options(options) {
    Debug::log("flv", "FLVReader::FLVReader() - max tag size ", m_options.max_tag_size,
               ", strict header length: ", (m_options.strict_header_length ? "yes" : "no"));
}

std::unique_ptr<FLVReader> FLVReader::open(const std::string& uri, const FLVReaderOptions& options) {
    IO::URI parsed(uri);
    std::unique_ptr<IOHandler> handler;

    // Network transports are the caller's business: hand in an IOHandler
    if (parsed.scheme() != "file") {
        throw IOException("Unsupported URI scheme: " + parsed.scheme());
    }
    handler = std::make_unique<FileIOHandler>(parsed.path());

    Debug::log("flv", "FLVReader::open() - ", uri, " (", parsed.scheme(), ")");
    return std::make_unique<FLVReader>(std::move(handler), options);
}

std::string FLVReader::hexBytes(const uint8_t* data, size_t length) {
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (size_t i = 0; i < length; ++i) {
        out << std::setw(2) << static_cast<unsigned>(data[i]);
    }
    return out.str();
}

Header FLVReader::readHeader() {
    if (m_state == State::Failed) {
        throw std::logic_error("FLVReader: header was already rejected");
    }
    if (m_state != State::Start) {
        throw std::logic_error("FLVReader: readHeader() called twice");
    }

    // Anything thrown from here on leaves the reader unusable
    m_state = State::Failed;

    const uint8_t* b;
    try {
        b = m_reader.peek(FLV_HEADER_SIZE);
    } catch (const EndOfInputException& e) {
        throw IOException("Input too short for an FLV header: " + std::to_string(e.available()) +
                          " of " + std::to_string(FLV_HEADER_SIZE) + " bytes");
    }

    if (get24(b) != FLV_SIGNATURE) {
        DEBUG_LOG("flv", "Bad signature ", hexBytes(b, 3));
        throw FormatException("Incorrect FLV signature: 0x" + hexBytes(b, 3),
                              std::vector<uint8_t>(b, b + 3));
    }

    if (b[3] != FLV_VERSION) {
        DEBUG_LOG("flv", "Unsupported version ", static_cast<int>(b[3]));
        throw FormatException("Unsupported FLV version: " + std::to_string(b[3]),
                              std::vector<uint8_t>(b + 3, b + 4));
    }

    uint32_t header_length = get32(b + 5);
    int64_t extra = static_cast<int64_t>(header_length) - static_cast<int64_t>(FLV_HEADER_SIZE);
    if (extra < 0 && m_options.strict_header_length) {
        throw FormatException("FLV header length " + std::to_string(header_length) +
                              " is shorter than " + std::to_string(FLV_HEADER_SIZE),
                              std::vector<uint8_t>(b + 5, b + 9));
    }

    Header header(b[4]);
    m_reader.markSkip(extra);
    m_state = State::TagLoop;

    Debug::log("flv", "FLVReader::readHeader() - flags 0x", hexBytes(b + 4, 1),
               ", header length ", header_length,
               ", video: ", (header.hasVideo() ? "yes" : "no"),
               ", audio: ", (header.hasAudio() ? "yes" : "no"));
    return header;
}

TagRecord FLVReader::readTag() {
    switch (m_state) {
        case State::Start:
            throw std::logic_error("FLVReader: readTag() called before readHeader()");
        case State::Failed:
            throw std::logic_error("FLVReader: header was rejected");
        case State::Done:
            throw EndOfInputException(m_trailing_bytes);
        case State::TagLoop:
            break;
    }

    const uint8_t* b;
    try {
        b = m_reader.peek(FLV_TAG_REGION_SIZE);
    } catch (const EndOfInputException& e) {
        // Every FLV file closes with the size of its last tag
        if (e.available() == 0 || e.available() == FLV_PREVIOUS_TAG_SIZE_LENGTH) {
            m_state = State::Done;
            m_trailing_bytes = e.available();
            Debug::log("flv", "FLVReader::readTag() - End of input after ", m_tags_read, " tags");
            throw;
        }
        throw IOException("Truncated FLV tag header: " + std::to_string(e.available()) +
                          " of " + std::to_string(FLV_TAG_REGION_SIZE) + " bytes at offset " +
                          std::to_string(m_reader.offset()));
    }

    Tag tag;
    tag.type = b[4];
    tag.size = get24(b + 5);
    tag.time = getTimestamp(b + 8);
    tag.stream = get24(b + 12);

    if (tag.size > m_options.max_tag_size) {
        throw FormatException("FLV tag size " + std::to_string(tag.size) + " exceeds limit " +
                              std::to_string(m_options.max_tag_size),
                              std::vector<uint8_t>(b + 5, b + 8));
    }

    Debug::log("flv", "FLVReader::readTag() - #", m_tags_read, " ", tagTypeName(tag.type),
               " size ", tag.size, " time ", tag.time, "ms");

    ++m_tags_read;
    return TagRecord{tag, m_reader.boundedReader(static_cast<int64_t>(tag.size))};
}

} // namespace FLV
} // namespace Demuxer
} // namespace FLVTag
