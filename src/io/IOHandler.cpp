/*
 * IOHandler.cpp - Abstract byte source interface
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
namespace IO {

size_t IOHandler::read(void* buffer, size_t size, size_t count) {
    std::lock_guard<std::mutex> lock(m_io_mutex);

    updateErrorState(0);
    if (m_closed.load()) {
        updateErrorState(EBADF);
        return 0;
    }
    if (size == 0 || count == 0) {
        return 0;
    }
    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }

    size_t got = read_unlocked(buffer, size * count);
    m_offset += static_cast<off_t>(got);
    return got / size;
}

int IOHandler::seek(off_t offset, int whence) {
    std::lock_guard<std::mutex> lock(m_io_mutex);

    if (m_closed.load()) {
        updateErrorState(EBADF);
        return -1;
    }
    if (!isSeekable()) {
        updateErrorState(ESPIPE);
        return -1;
    }

    off_t target;
    switch (whence) {
        case SEEK_SET:
            target = offset;
            break;
        case SEEK_CUR:
            target = m_offset.load() + offset;
            break;
        case SEEK_END: {
            off_t size = size_unlocked();
            if (size < 0) {
                updateErrorState(ESPIPE);
                return -1;
            }
            target = size + offset;
            break;
        }
        default:
            updateErrorState(EINVAL);
            return -1;
    }

    if (target < 0) {
        updateErrorState(EINVAL);
        return -1;
    }

    if (seek_unlocked(target) != 0) {
        Debug::log("io", "IOHandler::seek() - Seek to ", target, " failed: ", strerror(m_error.load()));
        return -1;
    }

    m_offset.store(target);
    off_t size = size_unlocked();
    updateEofState(size >= 0 && target >= size);
    updateErrorState(0);
    return 0;
}

off_t IOHandler::tell() {
    if (m_closed.load()) {
        updateErrorState(EBADF);
        return -1;
    }
    return m_offset.load();
}

int IOHandler::close() {
    std::lock_guard<std::mutex> lock(m_io_mutex);

    if (m_closed.load()) {
        return 0;
    }

    int result = close_unlocked();
    m_closed.store(true);
    m_at_eof.store(true);
    return result;
}

bool IOHandler::eof() {
    return m_closed.load() || m_at_eof.load();
}

off_t IOHandler::getFileSize() {
    std::lock_guard<std::mutex> lock(m_io_mutex);
    return m_closed.load() ? -1 : size_unlocked();
}

size_t IOHandler::read_unlocked(void* buffer, size_t bytes) {
    // Nothing behind the base class
    (void)buffer;
    (void)bytes;
    updateEofState(true);
    return 0;
}

int IOHandler::seek_unlocked(off_t target) {
    (void)target;
    updateErrorState(ESPIPE);
    return -1;
}

} // namespace IO
} // namespace FLVTag
