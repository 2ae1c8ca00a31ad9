/*
 * URI.cpp - URI parsing class
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

/**
 * @brief Constructs a URI object by parsing a URI string.
 *
 * The parser handles common `file:` scheme variations (`file:///` and `file:/`) as well as generic `scheme://` formats. If no scheme is detected, it defaults to "file".
 * @param uri_string The full URI string to parse.
 */
URI::URI(const std::string& uri_string) : m_uri(uri_string)
{
    const std::string& s = uri_string;

    // Handle the common "file:///" case, which indicates a local file path.
    if (s.rfind("file:///", 0) == 0) {
        m_scheme = "file";
        m_path = s.substr(7);
    }
    // Handle the older "file:/" case, also for local files.
    else if (s.rfind("file:/", 0) == 0) {
        m_scheme = "file";
        m_path = s.substr(5);
    } else {
        // Any other scheme://, or a plain file path.
        size_t scheme_end = s.find("://");
        if (scheme_end != std::string::npos && scheme_end > 0) {
            m_scheme = s.substr(0, scheme_end);
            std::transform(m_scheme.begin(), m_scheme.end(), m_scheme.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            m_path = s.substr(scheme_end + 3);
        } else {
            // No scheme provided, assume it's a local file path.
            m_scheme = "file";
            m_path = s;
        }
    }
}

const std::string& URI::scheme() const
{
    return m_scheme;
}

const std::string& URI::path() const
{
    return m_path;
}

const std::string& URI::str() const
{
    return m_uri;
}

} // namespace IO
} // namespace FLVTag
