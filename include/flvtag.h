/*
 * flvtag.h - Main header file for FLVTag
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

#ifndef __FLVTAG_H__
#define __FLVTAG_H__

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

// defines
#define FLVTAG_VERSION "1.0.0"
#define FLVTAG_MAINTAINER "Kirn Gill II <segin2005@gmail.com>"

//
// C++ Standard Library
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

// C Standard Library (wrapped)
#include <cctype>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

// System-specific headers
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

// Local project headers (in dependency order where possible)
#include "debug.h"
#include "exceptions.h"
#include "core/utility/ByteOrder.h"

// I/O Handler subsystem
#include "io/IOHandler.h"
#include "io/file/RAIIFileHandle.h"
#include "io/file/FileIOHandler.h"
#include "io/MemoryIOHandler.h"
#include "io/URI.h"
#include "io/PeekReader.h"

// Using declarations for I/O classes
using FLVTag::IO::IOHandler;
using FLVTag::IO::File::FileIOHandler;
using FLVTag::IO::MemoryIOHandler;
using FLVTag::IO::URI;
using FLVTag::IO::PeekReader;
using FLVTag::IO::PayloadStream;

// Container reader
#include "demuxer/flv/FLVTypes.h"
#include "demuxer/flv/FLVReader.h"

using FLVTag::Demuxer::FLV::FLVReader;
using FLVTag::Demuxer::FLV::FLVReaderOptions;

#endif // __FLVTAG_H__
