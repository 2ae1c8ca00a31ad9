/*
 * PeekReader.h - Buffered peek/skip reader over an IOHandler
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

#ifndef PEEKREADER_H
#define PEEKREADER_H

// No direct includes - all includes should be in flvtag.h

namespace FLVTag {
namespace IO {

class PeekReader;

/**
 * @brief Sequential stream over a bounded run of bytes owned by a PeekReader
 *
 * Handed out by PeekReader::boundedReader(). The stream does not keep a
 * count of its own for what is left to skip: it draws down the reader's
 * pending-skip counter, so bytes it never delivers are skipped by the
 * reader on its next peek or grant.
 *
 * A stream is valid only until the next peek() or boundedReader() call on
 * its reader. After that it is stale: read() returns 0 and getLastError()
 * reports ESTALE. A stream that outlives its reader is detached and reports
 * EBADF, as does a moved-from one.
 */
class PayloadStream {
public:
    PayloadStream() = default;
    PayloadStream(PayloadStream&& other) noexcept;
    PayloadStream& operator=(PayloadStream&& other) noexcept;

    PayloadStream(const PayloadStream&) = delete;
    PayloadStream& operator=(const PayloadStream&) = delete;

    /**
     * @brief Read data with fread-like semantics, never past the bound
     * @param buffer Buffer to read data into
     * @param size Size of each element to read
     * @param count Number of elements to read
     * @return Number of elements successfully read
     */
    size_t read(void* buffer, size_t size, size_t count);

    /**
     * @brief True once the bound is reached, the stream is stale or an
     *        error occurred
     */
    bool eof() const;

    // Bytes delivered so far
    size_t tell() const { return m_read; }

    // Declared length of the run
    size_t size() const { return m_size; }

    size_t remaining() const;

    /**
     * @brief Get the last error code
     * @return 0, EBADF (no reader, or reader destroyed), ESTALE (superseded), EIO (source ended
     *         early) or the source's own error code
     */
    int getLastError() const;

    /**
     * @brief Read everything that is left
     * @throws IOException if the source cannot deliver the rest, the
     *         stream is stale or its reader is gone
     */
    std::vector<uint8_t> readAll();

    /**
     * @brief Give up on the rest without reading it
     *
     * The bytes stay marked as skipped in the reader, which drops or seeks
     * past them on its next operation.
     */
    void discard();

private:
    friend class PeekReader;

    PayloadStream(std::weak_ptr<PeekReader*> owner, uint64_t generation, size_t size);

    // The reader, or null if it was destroyed or this stream was moved from
    PeekReader* reader() const;

    bool isStale() const;

    std::weak_ptr<PeekReader*> m_owner;
    uint64_t m_generation = 0;
    size_t m_size = 0;
    size_t m_read = 0;
    bool m_discarded = false;
    int m_error = 0;
};

/**
 * @brief Lazy peek-then-skip reader with a seek fallback
 *
 * Bytes returned by peek() or granted to a PayloadStream count as consumed
 * straight away, but they are only removed from the buffer (the pending
 * skip) when the next peek() or boundedReader() is issued. If more bytes
 * are pending than are buffered and the source can seek, the buffer is
 * dropped and the source seeks over the remainder instead of reading it.
 *
 * Whether the source can seek is sampled once, at construction.
 *
 * Not thread-safe; one owner at a time.
 */
class PeekReader {
public:
    static constexpr size_t DEFAULT_BUFFER_SIZE = 4096;

    /**
     * @brief Take ownership of a source
     * @param source Byte source to read from
     * @param buffer_size Read-ahead buffer capacity in bytes
     * @throws std::invalid_argument if source is null or buffer_size is 0
     */
    explicit PeekReader(std::unique_ptr<IOHandler> source,
                        size_t buffer_size = DEFAULT_BUFFER_SIZE);

    ~PeekReader();

    PeekReader(const PeekReader&) = delete;
    PeekReader& operator=(const PeekReader&) = delete;

    /**
     * @brief Look at the next n bytes without consuming them
     *
     * The returned pointer stays valid until the next call on this reader.
     * The n bytes become the pending skip.
     * @throws EndOfInputException if the source ends with fewer than n
     *         bytes available (available() tells how many)
     * @throws IOException on a source error or a failed pending skip
     */
    const uint8_t* peek(size_t n);

    /**
     * @brief Add n bytes to the pending skip; no-op for n <= 0
     */
    void markSkip(int64_t n);

    /**
     * @brief Grant a stream over the next n bytes
     *
     * The n bytes become the pending skip whether or not the stream is read.
     * @throws std::invalid_argument if n is negative
     * @throws IOException on a failed pending skip
     */
    PayloadStream boundedReader(int64_t n);

    /**
     * @brief Logical offset of the cursor in the source
     *
     * Bytes physically consumed plus the pending skip.
     */
    uint64_t offset() const { return m_consumed + static_cast<uint64_t>(m_pending); }

    // Bytes currently held in the read-ahead buffer
    size_t buffered() const { return m_end - m_start; }

    size_t capacity() const { return m_buffer.size(); }

    bool isSeekable() const { return m_seekable; }

    IOHandler& source() { return *m_source; }

private:
    friend class PayloadStream;

    // Consume the pending skip, by seek where possible
    void resolvePending();

    // Drop count bytes, refilling from the source as needed
    void discard(uint64_t count);

    /**
     * @brief Make sure at least n bytes are buffered
     * @return false if the source ended first
     * @throws IOException on a source error
     */
    bool fill(size_t n);

    /**
     * @brief One read from the source into the free tail of the buffer
     *
     * A seekable source is asked to fill the whole tail. A stream is asked
     * for no more than wanted, since an fread-style source blocks until it
     * delivers the full count and a live producer may never send more.
     */
    size_t readMore(size_t wanted);

    // Serve a PayloadStream read; returns bytes delivered
    size_t readPayload(uint64_t generation, uint8_t* dest, size_t bytes, int& error);

    std::shared_ptr<PeekReader*> m_self;     // Expires with the reader; streams watch it
    std::unique_ptr<IOHandler> m_source;
    std::vector<uint8_t> m_buffer;
    size_t m_start = 0;             // First unconsumed byte in m_buffer
    size_t m_end = 0;               // One past the last filled byte
    int64_t m_pending = 0;          // Pending skip, shared with the live PayloadStream
    uint64_t m_consumed = 0;        // Source offset of m_buffer[m_start]
    uint64_t m_generation = 0;      // Bumped by every peek and grant
    bool m_seekable = false;
};

} // namespace IO
} // namespace FLVTag

#endif // PEEKREADER_H
