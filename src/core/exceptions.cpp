/*
 * exceptions.cpp - Exception classes code
 * This file is part of FLVTag.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
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
namespace Core {

/**
 * @brief Constructs a FormatException.
 *
 * This exception is thrown when the input is read as FLV but one of the
 * validated fields (signature, version, tag size) holds a value the reader
 * refuses to accept.
 * @param why A string describing the nature of the format error.
 */
FormatException::FormatException(const std::string &why)
    : std::exception(), m_why(why) {
  // ctor
}

/**
 * @brief Constructs a FormatException carrying the offending bytes.
 * @param why A string describing the nature of the format error.
 * @param bytes The raw bytes that failed validation.
 */
FormatException::FormatException(const std::string &why, const std::vector<uint8_t> &bytes)
    : std::exception(), m_why(why), m_bytes(bytes) {
  // ctor
}

/**
 * @brief Returns the exception's explanatory string.
 * @return A C-style string detailing the format error.
 */
const char *FormatException::what() const noexcept { return m_why.c_str(); }

const std::vector<uint8_t> &FormatException::bytes() const noexcept {
  return m_bytes;
}

/**
 * @brief Constructs an IOException.
 *
 * This exception is used when the byte source cannot deliver what was
 * asked of it: a short read or discard, a failed seek, or an error
 * reported by the underlying handler.
 * @param why A string describing the I/O error.
 */
IOException::IOException(const std::string &why)
    : std::exception(), m_why(why) {
  // ctor
}

/**
 * @brief Returns the exception's explanatory string.
 * @return A C-style string detailing the I/O error.
 */
const char *IOException::what() const noexcept { return m_why.c_str(); }

/**
 * @brief Constructs an EndOfInputException.
 *
 * Signals that the source ran out where a new structure would have begun.
 * @param available Number of bytes that were still available when the
 *                  end was detected.
 */
EndOfInputException::EndOfInputException(size_t available)
    : std::exception(), m_available(available),
      m_why("end of input (" + std::to_string(available) + " trailing bytes)") {
  // ctor
}

const char *EndOfInputException::what() const noexcept { return m_why.c_str(); }

size_t EndOfInputException::available() const noexcept { return m_available; }

} // namespace Core
} // namespace FLVTag
