/*
 * MemoryIOHandler.cpp - In-memory byte source
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

MemoryIOHandler::MemoryIOHandler(const void* data, size_t size, bool seekable)
    : m_seekable(seekable) {
    if (data && size > 0) {
        const uint8_t* bytes = static_cast<const uint8_t*>(data);
        m_data.assign(bytes, bytes + size);
    }
    Debug::log("io", "MemoryIOHandler::MemoryIOHandler() - ", size, " bytes, ",
               (seekable ? "seekable" : "stream"));
}

MemoryIOHandler::MemoryIOHandler(bool seekable) : m_seekable(seekable) {
}

size_t MemoryIOHandler::write(const void* data, size_t size) {
    if (isClosed() || !data || size == 0) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(m_data_mutex);
    const uint8_t* bytes = static_cast<const uint8_t*>(data);
    m_data.insert(m_data.end(), bytes, bytes + size);
    updateEofState(false);
    return size;
}

size_t MemoryIOHandler::read_unlocked(void* buffer, size_t bytes) {
    std::lock_guard<std::mutex> lock(m_data_mutex);

    size_t available = m_cursor < m_data.size() ? m_data.size() - m_cursor : 0;
    size_t got = std::min(bytes, available);
    if (got > 0) {
        std::memcpy(buffer, m_data.data() + m_cursor, got);
        m_cursor += got;
    }
    updateEofState(m_cursor >= m_data.size());
    return got;
}

int MemoryIOHandler::seek_unlocked(off_t target) {
    std::lock_guard<std::mutex> lock(m_data_mutex);
    // Past the end is allowed; reads there return 0
    m_cursor = static_cast<size_t>(target);
    return 0;
}

off_t MemoryIOHandler::size_unlocked() {
    std::lock_guard<std::mutex> lock(m_data_mutex);
    return static_cast<off_t>(m_data.size());
}

int MemoryIOHandler::close_unlocked() {
    std::lock_guard<std::mutex> lock(m_data_mutex);
    m_data.clear();
    m_data.shrink_to_fit();
    return 0;
}

} // namespace IO
} // namespace FLVTag
