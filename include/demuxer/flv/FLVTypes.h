/*
 * FLVTypes.h - FLV header and tag records
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

#ifndef FLVTYPES_H
#define FLVTYPES_H

// No direct includes - all includes should be in flvtag.h

namespace FLVTag {
namespace Demuxer {
namespace FLV {

// "FLV" as a 24-bit big-endian value
constexpr uint32_t FLV_SIGNATURE = 0x464C56;
constexpr uint8_t FLV_VERSION = 1;

// File header, then (previous tag size + tag header) per tag
constexpr size_t FLV_HEADER_SIZE = 9;
constexpr size_t FLV_TAG_REGION_SIZE = 15;
constexpr size_t FLV_PREVIOUS_TAG_SIZE_LENGTH = 4;

constexpr uint32_t FLV_MAX_TAG_SIZE = 0xFFFFFF;

/**
 * @brief FLV file header
 */
struct Header {
    uint8_t flags = 0;

    Header() = default;
    explicit Header(uint8_t f) : flags(f) {}

    bool hasVideo() const { return (flags & 0x01) != 0; }
    bool hasAudio() const { return (flags & 0x04) != 0; }
};

/**
 * @brief Well-known tag types. Other values are passed through unchanged.
 */
enum class TagType : uint8_t {
    Audio = 8,
    Video = 9,
    Script = 18
};

/**
 * @brief Human-readable name of a tag type byte
 * @return "audio", "video", "script" or "other"
 */
inline const char* tagTypeName(uint8_t type) {
    switch (type) {
        case static_cast<uint8_t>(TagType::Audio):
            return "audio";
        case static_cast<uint8_t>(TagType::Video):
            return "video";
        case static_cast<uint8_t>(TagType::Script):
            return "script";
        default:
            return "other";
    }
}

/**
 * @brief One tag header as read from the file
 */
struct Tag {
    uint8_t type = 0;       // Raw type byte, see TagType
    uint32_t size = 0;      // Payload length in bytes
    int64_t time = 0;       // Timestamp in milliseconds
    uint32_t stream = 0;    // Stream ID, normally 0

    bool is(TagType t) const { return type == static_cast<uint8_t>(t); }
};

/**
 * @brief A tag together with the stream over its payload
 *
 * The payload is only readable until the next readTag() call.
 */
struct TagRecord {
    Tag tag;
    IO::PayloadStream payload;
};

} // namespace FLV
} // namespace Demuxer
} // namespace FLVTag

#endif // FLVTYPES_H
