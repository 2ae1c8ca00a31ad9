/*
 * FileIOHandler.cpp - stdio-backed byte source
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
namespace File {

FileIOHandler::FileIOHandler(const std::string& path) : m_path(path) {
    if (path == "-") {
        m_file.reset(stdin, false);
    } else {
        FILE* file = std::fopen(path.c_str(), "rb");
        if (!file) {
            int error = errno;
            updateErrorState(error);
            Debug::log("io", "FileIOHandler::FileIOHandler() - Cannot open ", path, ": ", strerror(error));
            throw IOException("Could not open file: " + path + ": " + strerror(error));
        }
        m_file.reset(file);
    }

    struct stat st;
    if (fstat(fileno(m_file.get()), &st) == 0 && S_ISREG(st.st_mode)) {
        m_regular = true;
        m_size = st.st_size;
    }

    Debug::log("io", "FileIOHandler::FileIOHandler() - ", (path == "-" ? "<stdin>" : path), ": ",
               (m_regular ? "regular file" : "stream"), ", size ", m_size);
}

FileIOHandler::~FileIOHandler() {
    close();
}

size_t FileIOHandler::read_unlocked(void* buffer, size_t bytes) {
    FILE* file = m_file.get();
    size_t got = std::fread(buffer, 1, bytes, file);

    if (got < bytes) {
        if (std::ferror(file)) {
            int error = errno ? errno : EIO;
            std::clearerr(file);
            updateErrorState(error);
            Debug::log("io", "FileIOHandler::read() - ", m_path, ": ", strerror(error));
        } else if (std::feof(file)) {
            updateEofState(true);
        }
    }
    return got;
}

int FileIOHandler::seek_unlocked(off_t target) {
    if (fseeko(m_file.get(), target, SEEK_SET) != 0) {
        updateErrorState(errno);
        return -1;
    }
    return 0;
}

off_t FileIOHandler::size_unlocked() {
    return m_size;
}

int FileIOHandler::close_unlocked() {
    int result = m_file.close();
    if (result != 0) {
        updateErrorState(errno);
        Debug::log("io", "FileIOHandler::close() - ", m_path, ": ", strerror(errno));
    }
    return result;
}

} // namespace File
} // namespace IO
} // namespace FLVTag
