/*
 * ByteOrder.h - Big-endian field helpers for FLV headers
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

#ifndef FLVTAG_CORE_UTILITY_BYTEORDER_H
#define FLVTAG_CORE_UTILITY_BYTEORDER_H

#include <cstdint>

namespace FLVTag {
namespace Core {
namespace Utility {
namespace ByteOrder {

/**
 * @brief Decode a 24-bit big-endian unsigned integer.
 * @param b Pointer to at least 3 readable bytes
 */
inline uint32_t get24(const uint8_t *b)
{
	return static_cast<uint32_t>(b[2]) |
	       static_cast<uint32_t>(b[1]) << 8 |
	       static_cast<uint32_t>(b[0]) << 16;
}

/**
 * @brief Encode the low 24 bits of v big-endian into b[0..2].
 */
inline void put24(uint8_t *b, uint32_t v)
{
	b[0] = static_cast<uint8_t>(v >> 16);
	b[1] = static_cast<uint8_t>(v >> 8);
	b[2] = static_cast<uint8_t>(v);
}

/**
 * @brief Decode a 32-bit big-endian unsigned integer.
 * @param b Pointer to at least 4 readable bytes
 */
inline uint32_t get32(const uint8_t *b)
{
	return static_cast<uint32_t>(b[3]) |
	       static_cast<uint32_t>(b[2]) << 8 |
	       static_cast<uint32_t>(b[1]) << 16 |
	       static_cast<uint32_t>(b[0]) << 24;
}

inline void put32(uint8_t *b, uint32_t v)
{
	b[0] = static_cast<uint8_t>(v >> 24);
	b[1] = static_cast<uint8_t>(v >> 16);
	b[2] = static_cast<uint8_t>(v >> 8);
	b[3] = static_cast<uint8_t>(v);
}

/**
 * @brief Decode an FLV tag timestamp in milliseconds.
 *
 * The field is a 24-bit big-endian value followed by an extension byte
 * that supplies bits 24-31.
 * @param b Pointer to the 4-byte timestamp field
 */
inline int64_t getTimestamp(const uint8_t *b)
{
	return static_cast<int64_t>(b[2]) |
	       static_cast<int64_t>(b[1]) << 8 |
	       static_cast<int64_t>(b[0]) << 16 |
	       static_cast<int64_t>(b[3]) << 24;
}

/**
 * @brief Encode a timestamp in the FLV layout. Only the low 32 bits of v
 *        are representable.
 */
inline void putTimestamp(uint8_t *b, int64_t v)
{
	b[0] = static_cast<uint8_t>(v >> 16);
	b[1] = static_cast<uint8_t>(v >> 8);
	b[2] = static_cast<uint8_t>(v);
	b[3] = static_cast<uint8_t>(v >> 24);
}

} // namespace ByteOrder
} // namespace Utility
} // namespace Core
} // namespace FLVTag

#endif // FLVTAG_CORE_UTILITY_BYTEORDER_H
