/*
 * IOHandler.h - Abstract byte source interface
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

#ifndef IOHANDLER_H
#define IOHANDLER_H

// No direct includes - all includes should be in flvtag.h

namespace FLVTag {
namespace IO {

/**
 * @brief Byte source with fread/fseek-style reporting
 *
 * The public methods take the handler lock, validate their arguments and
 * keep the position, then hand the real work to the private *_unlocked
 * hooks. Failures are reported as a short count or -1 with the reason in
 * getLastError(), never by exception.
 *
 * Seeking is a run-time capability: the same class may wrap a regular file
 * or a FIFO. isSeekable() says which.
 */
class IOHandler {
public:
    IOHandler() = default;
    virtual ~IOHandler() = default;

    IOHandler(const IOHandler&) = delete;
    IOHandler& operator=(const IOHandler&) = delete;

    /**
     * @brief Read up to size * count bytes
     * @return Number of whole elements read; short on end of data or error
     */
    virtual size_t read(void* buffer, size_t size, size_t count);

    /**
     * @brief Move the read position
     * @param whence SEEK_SET, SEEK_CUR or SEEK_END
     * @return 0 on success, -1 with ESPIPE, EINVAL or EBADF otherwise
     */
    virtual int seek(off_t offset, int whence);

    // Current position, -1 once closed
    virtual off_t tell();

    virtual int close();

    virtual bool eof();

    // Total size in bytes, -1 when unknown
    virtual off_t getFileSize();

    int getLastError() const { return m_error.load(); }

    virtual bool isSeekable() const { return false; }

protected:
    void updateErrorState(int error_code) { m_error.store(error_code); }
    void updateEofState(bool eof_state) { m_at_eof.store(eof_state); }

    bool isClosed() const { return m_closed.load(); }

private:
    // Hooks, called with m_io_mutex held and arguments already checked

    // Read up to bytes into buffer; returns bytes delivered
    virtual size_t read_unlocked(void* buffer, size_t bytes);

    // Position at an absolute, non-negative target
    virtual int seek_unlocked(off_t target);

    virtual off_t size_unlocked() { return -1; }

    virtual int close_unlocked() { return 0; }

    std::mutex m_io_mutex;
    std::atomic<off_t> m_offset{0};
    std::atomic<bool> m_closed{false};
    std::atomic<bool> m_at_eof{false};
    std::atomic<int> m_error{0};
};

} // namespace IO
} // namespace FLVTag

#endif // IOHANDLER_H
