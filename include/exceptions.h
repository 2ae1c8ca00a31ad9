/*
 * exceptions.h - Various exception classes.
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

#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

namespace FLVTag {
namespace Core {

// Correct container, but a field holds a value we cannot accept
// (bad signature, unsupported version, oversized tag).
class FormatException : public std::exception
{
    public:
        explicit FormatException(const std::string &why);
        FormatException(const std::string &why, const std::vector<uint8_t> &bytes);
        ~FormatException() noexcept override = default;
        const char *what() const noexcept override;
        // Raw bytes that failed validation, if any were captured
        const std::vector<uint8_t> &bytes() const noexcept;
    protected:
    private:
        std::string m_why;
        std::vector<uint8_t> m_bytes;
};

// Underlying read, discard or seek failed, or input ended mid-structure.
class IOException : public std::exception
{
    public:
        explicit IOException(const std::string &why);
        ~IOException() noexcept override = default;
        const char *what() const noexcept override;
    protected:
    private:
        std::string m_why;
};

// Input ended cleanly on a tag boundary. Not an IOException on purpose:
// callers stop iterating on this one.
class EndOfInputException : public std::exception
{
    public:
        explicit EndOfInputException(size_t available = 0);
        ~EndOfInputException() noexcept override = default;
        const char *what() const noexcept override;
        size_t available() const noexcept;
    protected:
    private:
        size_t m_available;
        std::string m_why;
};

} // namespace Core
} // namespace FLVTag

using FLVTag::Core::FormatException;
using FLVTag::Core::IOException;
using FLVTag::Core::EndOfInputException;

#endif // EXCEPTIONS_H
