/*
 * FileIOHandler.h - stdio-backed byte source
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

#ifndef FILEIOHANDLER_H
#define FILEIOHANDLER_H

// No direct includes - all includes should be in flvtag.h

namespace FLVTag {
namespace IO {
namespace File {

/**
 * @brief IOHandler over a local file, FIFO or standard input
 *
 * The path "-" borrows stdin. Only a regular file is seekable; anything
 * else fstat reports (pipe, FIFO, terminal, socket) is read as a stream.
 */
class FileIOHandler : public IOHandler {
public:
    /**
     * @param path File to open, or "-" for standard input
     * @throws IOException if the file cannot be opened
     */
    explicit FileIOHandler(const std::string& path);

    ~FileIOHandler() override;

    bool isSeekable() const override { return m_regular && !isClosed(); }

    const std::string& getPath() const { return m_path; }

private:
    size_t read_unlocked(void* buffer, size_t bytes) override;
    int seek_unlocked(off_t target) override;
    off_t size_unlocked() override;
    int close_unlocked() override;

    RAIIFileHandle m_file;
    std::string m_path;
    bool m_regular = false;
    off_t m_size = -1;          // fstat size, regular files only
};

} // namespace File
} // namespace IO
} // namespace FLVTag

#endif // FILEIOHANDLER_H
