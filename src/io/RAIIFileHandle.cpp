/*
 * RAIIFileHandle.cpp - Owned FILE* for whole-file reads and writes
 * This file is part of LapCut.
 * Copyright © 2025-2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
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

#include "lapcut.h"

namespace LapCut {
namespace IO {

namespace {

constexpr size_t READ_CHUNK = 65536;

} // namespace

RAIIFileHandle::RAIIFileHandle(RAIIFileHandle&& other) noexcept
    : m_file(other.m_file), m_path(std::move(other.m_path)) {
    other.m_file = nullptr;
}

RAIIFileHandle& RAIIFileHandle::operator=(RAIIFileHandle&& other) noexcept {
    if (this != &other) {
        close();
        m_file = other.m_file;
        m_path = std::move(other.m_path);
        other.m_file = nullptr;
    }
    return *this;
}

RAIIFileHandle::~RAIIFileHandle() noexcept {
    close();
}

bool RAIIFileHandle::open(const std::string& path, const char* mode) {
    close();

    m_file = fopen(path.c_str(), mode);
    if (!m_file) {
        int saved_errno = errno;
        Debug::log("io", "Cannot open ", path, " (", mode, "): ", strerror(saved_errno));
        errno = saved_errno;
        return false;
    }

    m_path = path;
    return true;
}

bool RAIIFileHandle::readAll(std::vector<uint8_t>& out) {
    if (!m_file) {
        errno = EBADF;
        return false;
    }

    uint8_t chunk[READ_CHUNK];
    size_t count;
    while ((count = fread(chunk, 1, sizeof(chunk), m_file)) > 0) {
        out.insert(out.end(), chunk, chunk + count);
    }
    return !ferror(m_file);
}

bool RAIIFileHandle::writeAll(const uint8_t* data, size_t size) noexcept {
    if (!m_file) {
        errno = EBADF;
        return false;
    }
    if (size > 0 && fwrite(data, 1, size, m_file) != size) {
        return false;
    }
    return fflush(m_file) == 0;
}

int RAIIFileHandle::close() noexcept {
    if (!m_file) {
        return 0;
    }

    int result = fclose(m_file);
    m_file = nullptr;
    if (result != 0) {
        int saved_errno = errno;
        Debug::log("io", "Error closing ", m_path, ": ", strerror(saved_errno));
        errno = saved_errno;
    }
    return result;
}

} // namespace IO
} // namespace LapCut
