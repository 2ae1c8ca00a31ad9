/*
 * PeekReader.cpp - Buffered peek/skip reader over an IOHandler
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

constexpr size_t PeekReader::DEFAULT_BUFFER_SIZE;

// PayloadStream

PayloadStream::PayloadStream(std::weak_ptr<PeekReader*> owner, uint64_t generation, size_t size)
    : m_owner(std::move(owner)), m_generation(generation), m_size(size) {
}

PayloadStream::PayloadStream(PayloadStream&& other) noexcept
    : m_owner(std::move(other.m_owner)), m_generation(other.m_generation), m_size(other.m_size),
      m_read(other.m_read), m_discarded(other.m_discarded), m_error(other.m_error) {
    other.m_owner.reset();
}

PayloadStream& PayloadStream::operator=(PayloadStream&& other) noexcept {
    if (this != &other) {
        m_owner = std::move(other.m_owner);
        m_generation = other.m_generation;
        m_size = other.m_size;
        m_read = other.m_read;
        m_discarded = other.m_discarded;
        m_error = other.m_error;
        other.m_owner.reset();
    }
    return *this;
}

PeekReader* PayloadStream::reader() const {
    std::shared_ptr<PeekReader*> self = m_owner.lock();
    return self ? *self : nullptr;
}

bool PayloadStream::isStale() const {
    PeekReader* owner = reader();
    return owner && owner->m_generation != m_generation;
}

size_t PayloadStream::read(void* buffer, size_t size, size_t count) {
    if (size == 0 || count == 0) {
        return 0;
    }

    PeekReader* owner = reader();
    if (!owner) {
        m_error = EBADF;
        return 0;
    }

    if (isStale()) {
        m_error = ESTALE;
        return 0;
    }

    if (!buffer) {
        m_error = EINVAL;
        return 0;
    }

    size_t wanted = std::min(size * count, remaining());
    if (wanted == 0) {
        return 0;
    }

    int error = 0;
    size_t got = owner->readPayload(m_generation, static_cast<uint8_t*>(buffer), wanted, error);
    m_read += got;
    m_error = error;

    return got / size;
}

bool PayloadStream::eof() const {
    return !reader() || m_error != 0 || isStale() || remaining() == 0;
}

size_t PayloadStream::remaining() const {
    if (m_discarded || !reader() || isStale()) {
        return 0;
    }
    return m_size - m_read;
}

int PayloadStream::getLastError() const {
    if (!reader()) {
        return EBADF;
    }
    if (isStale()) {
        return ESTALE;
    }
    return m_error;
}

std::vector<uint8_t> PayloadStream::readAll() {
    if (isStale()) {
        throw IOException("Payload stream was superseded by a later read");
    }
    if (!reader() && !m_discarded && m_read < m_size) {
        throw IOException("Payload stream has no reader: " + std::to_string(m_size - m_read) +
                          " bytes unread");
    }

    std::vector<uint8_t> data(remaining());
    if (data.empty()) {
        return data;
    }

    size_t got = read(data.data(), 1, data.size());
    if (got < data.size()) {
        throw IOException("Payload truncated: got " + std::to_string(got) + " of " +
                          std::to_string(data.size()) + " bytes (" + strerror(m_error) + ")");
    }
    return data;
}

void PayloadStream::discard() {
    if (!m_discarded && reader()) {
        Debug::log("peek", "PayloadStream::discard() - Leaving ", remaining(), " bytes to the reader");
    }
    m_discarded = true;
}

// PeekReader

PeekReader::PeekReader(std::unique_ptr<IOHandler> source, size_t buffer_size)
    : m_self(std::make_shared<PeekReader*>(this)), m_source(std::move(source)) {
    if (!m_source) {
        throw std::invalid_argument("PeekReader requires a source");
    }
    if (buffer_size == 0) {
        throw std::invalid_argument("PeekReader buffer size must be non-zero");
    }

    m_buffer.resize(buffer_size);
    m_seekable = m_source->isSeekable();

    off_t start = m_source->tell();
    if (start > 0) {
        m_consumed = static_cast<uint64_t>(start);
    }

    Debug::log("peek", "PeekReader::PeekReader() - buffer ", buffer_size, " bytes, source ",
               (m_seekable ? "seekable" : "not seekable"), ", starting at ", m_consumed);
}

PeekReader::~PeekReader() {
    Debug::log("peek", "PeekReader::~PeekReader() - Released at offset ", offset());
}

const uint8_t* PeekReader::peek(size_t n) {
    resolvePending();
    ++m_generation;

    if (!fill(n)) {
        Debug::log("peek", "PeekReader::peek() - Source ended with ", buffered(), " of ", n, " bytes");
        throw EndOfInputException(buffered());
    }

    m_pending = static_cast<int64_t>(n);
    return m_buffer.data() + m_start;
}

void PeekReader::markSkip(int64_t n) {
    if (n > 0) {
        m_pending += n;
    }
}

PayloadStream PeekReader::boundedReader(int64_t n) {
    if (n < 0) {
        throw std::invalid_argument("Bounded reader length must be non-negative: " + std::to_string(n));
    }

    resolvePending();
    ++m_generation;

    m_pending = n;
    return PayloadStream(m_self, m_generation, static_cast<size_t>(n));
}

void PeekReader::resolvePending() {
    if (m_pending == 0) {
        return;
    }

    uint64_t pending = static_cast<uint64_t>(m_pending);
    size_t held = buffered();
    m_pending = 0;

    if (held < pending && m_seekable) {
        uint64_t skip = pending - held;
        m_consumed += held;
        m_start = m_end = 0;

        Debug::log("peek", "PeekReader::resolvePending() - Seeking over ", skip,
                   " unbuffered bytes (", held, " dropped from buffer)");

        if (m_source->seek(static_cast<off_t>(skip), SEEK_CUR) != 0) {
            int error = m_source->getLastError();
            throw IOException("Seek over " + std::to_string(skip) + " bytes failed: " +
                              strerror(error ? error : EIO));
        }
        m_consumed += skip;
        return;
    }

    if (held < pending) {
        Debug::log("peek", "PeekReader::resolvePending() - Discarding ", pending,
                   " bytes by reading (", held, " buffered)");
    }
    discard(pending);
}

void PeekReader::discard(uint64_t count) {
    while (count > 0) {
        if (buffered() == 0 && readMore(static_cast<size_t>(std::min<uint64_t>(count, SIZE_MAX))) == 0) {
            int error = m_source->getLastError();
            throw IOException("Short discard: " + std::to_string(count) + " bytes missing" +
                              (error ? std::string(" (") + strerror(error) + ")" : std::string()));
        }

        size_t chunk = static_cast<size_t>(std::min<uint64_t>(count, buffered()));
        m_start += chunk;
        m_consumed += chunk;
        count -= chunk;
    }
}

size_t PeekReader::readMore(size_t wanted) {
    if (m_start == m_end) {
        m_start = m_end = 0;
    } else if (m_end == m_buffer.size() && m_start > 0) {
        std::memmove(m_buffer.data(), m_buffer.data() + m_start, m_end - m_start);
        m_end -= m_start;
        m_start = 0;
    }

    size_t space = m_buffer.size() - m_end;
    if (space == 0) {
        return 0;
    }

    size_t request = m_seekable ? space : std::min(space, wanted);
    size_t got = m_source->read(m_buffer.data() + m_end, 1, request);
    m_end += got;
    return got;
}

bool PeekReader::fill(size_t n) {
    if (n > m_buffer.size()) {
        Debug::log("peek", "PeekReader::fill() - Growing buffer from ", m_buffer.size(), " to ", n, " bytes");
        std::vector<uint8_t> grown(n);
        std::memcpy(grown.data(), m_buffer.data() + m_start, buffered());
        m_end -= m_start;
        m_start = 0;
        m_buffer.swap(grown);
    }

    while (buffered() < n) {
        if (readMore(n - buffered()) == 0) {
            int error = m_source->getLastError();
            if (error != 0) {
                throw IOException(std::string("Read failed: ") + strerror(error));
            }
            return false;
        }
    }
    return true;
}

size_t PeekReader::readPayload(uint64_t generation, uint8_t* dest, size_t bytes, int& error) {
    error = 0;
    if (generation != m_generation) {
        error = ESTALE;
        return 0;
    }

    bytes = static_cast<size_t>(std::min<uint64_t>(bytes, static_cast<uint64_t>(m_pending)));
    size_t total = 0;

    while (total < bytes) {
        if (buffered() > 0) {
            size_t chunk = std::min(bytes - total, buffered());
            std::memcpy(dest + total, m_buffer.data() + m_start, chunk);
            m_start += chunk;
            total += chunk;
            continue;
        }

        size_t want = bytes - total;
        size_t got;
        if (want >= m_buffer.size()) {
            // Large request with an empty buffer: bypass the copy
            m_start = m_end = 0;
            got = m_source->read(dest + total, 1, want);
            total += got;
        } else {
            got = readMore(want);
        }

        if (got == 0) {
            int source_error = m_source->getLastError();
            error = source_error ? source_error : EIO;
            Debug::log("peek", "PeekReader::readPayload() - Source ended ", bytes - total,
                       " bytes short of the payload");
            break;
        }
    }

    m_pending -= static_cast<int64_t>(total);
    m_consumed += total;
    return total;
}

} // namespace IO
} // namespace FLVTag
