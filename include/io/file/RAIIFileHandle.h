/*
 * RAIIFileHandle.h - Owning wrapper for stdio FILE handles
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

#ifndef RAIIFILEHANDLE_H
#define RAIIFILEHANDLE_H

// No direct includes - all includes should be in flvtag.h

namespace FLVTag {
namespace IO {
namespace File {

/**
 * @brief Move-only holder for a FILE*
 *
 * Closes the stream on destruction when it owns it. A borrowed stream
 * (standard input, say) is only detached.
 */
class RAIIFileHandle {
public:
    RAIIFileHandle() noexcept = default;

    explicit RAIIFileHandle(FILE* file, bool take_ownership = true) noexcept
        : m_file(file), m_owns(file != nullptr && take_ownership) {}

    RAIIFileHandle(RAIIFileHandle&& other) noexcept
        : m_file(other.m_file), m_owns(other.m_owns) {
        other.m_file = nullptr;
        other.m_owns = false;
    }

    RAIIFileHandle& operator=(RAIIFileHandle&& other) noexcept {
        if (this != &other) {
            bool owns = other.m_owns;
            reset(other.release(), owns);
        }
        return *this;
    }

    RAIIFileHandle(const RAIIFileHandle&) = delete;
    RAIIFileHandle& operator=(const RAIIFileHandle&) = delete;

    ~RAIIFileHandle() { close(); }

    /**
     * @brief Drop the stream, closing it if owned
     * @return fclose() result, 0 for a borrowed or empty handle
     */
    int close() noexcept {
        FILE* file = m_file;
        bool owns = m_owns;
        m_file = nullptr;
        m_owns = false;
        return (file && owns) ? std::fclose(file) : 0;
    }

    // Give up the stream without closing it
    FILE* release() noexcept {
        FILE* file = m_file;
        m_file = nullptr;
        m_owns = false;
        return file;
    }

    void reset(FILE* file = nullptr, bool take_ownership = true) noexcept {
        close();
        m_file = file;
        m_owns = file != nullptr && take_ownership;
    }

    FILE* get() const noexcept { return m_file; }
    bool owns_handle() const noexcept { return m_owns; }
    explicit operator bool() const noexcept { return m_file != nullptr; }

private:
    FILE* m_file = nullptr;
    bool m_owns = false;
};

} // namespace File
} // namespace IO
} // namespace FLVTag

#endif // RAIIFILEHANDLE_H
