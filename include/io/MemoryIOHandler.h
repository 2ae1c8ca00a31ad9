/*
 * MemoryIOHandler.h - In-memory byte source
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

#ifndef MEMORYIOHANDLER_H
#define MEMORYIOHANDLER_H

// No direct includes - all includes should be in flvtag.h

namespace FLVTag {
namespace IO {

/**
 * @brief IOHandler over bytes held in memory
 *
 * Built with seekable = false it refuses every seek, so a buffer can stand
 * in for a pipe. write() appends, which lets a test feed a live stream
 * piece by piece.
 */
class MemoryIOHandler : public IOHandler {
public:
    // Copies size bytes from data
    MemoryIOHandler(const void* data, size_t size, bool seekable = true);

    explicit MemoryIOHandler(bool seekable = true);

    bool isSeekable() const override { return m_seekable && !isClosed(); }

    /**
     * @brief Append bytes after whatever is already held
     * @return Bytes appended, 0 once closed
     */
    size_t write(const void* data, size_t size);

private:
    size_t read_unlocked(void* buffer, size_t bytes) override;
    int seek_unlocked(off_t target) override;
    off_t size_unlocked() override;
    int close_unlocked() override;

    std::mutex m_data_mutex;        // write() may come from a feeder thread
    std::vector<uint8_t> m_data;
    size_t m_cursor = 0;
    bool m_seekable;
};

} // namespace IO
} // namespace FLVTag

#endif // MEMORYIOHANDLER_H
