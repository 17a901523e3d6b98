/*
 * RAIIFileHandle.h - Owned FILE* for whole-file reads and writes
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

#ifndef RAIIFILEHANDLE_H
#define RAIIFILEHANDLE_H

// No direct includes - all includes should be in lapcut.h

namespace LapCut {
namespace IO {

/**
 * @brief FILE* that is closed when it goes out of scope
 *
 * The bool-returning calls leave errno as the C library set it, so the
 * caller can turn a failure into an IOException with the right text.
 */
class RAIIFileHandle {
public:
    RAIIFileHandle() noexcept : m_file(nullptr) {}
    ~RAIIFileHandle() noexcept;

    RAIIFileHandle(RAIIFileHandle&& other) noexcept;
    RAIIFileHandle& operator=(RAIIFileHandle&& other) noexcept;

    RAIIFileHandle(const RAIIFileHandle&) = delete;
    RAIIFileHandle& operator=(const RAIIFileHandle&) = delete;

    bool open(const std::string& path, const char* mode);

    /**
     * @brief Append everything from the current position to EOF onto out
     */
    bool readAll(std::vector<uint8_t>& out);

    /**
     * @brief Write size bytes and flush them to the OS
     */
    bool writeAll(const uint8_t* data, size_t size) noexcept;

    /**
     * @return 0 on success, EOF if the final flush failed
     */
    int close() noexcept;

    FILE* get() const noexcept { return m_file; }
    explicit operator bool() const noexcept { return m_file != nullptr; }

private:
    FILE* m_file;
    std::string m_path;
};

} // namespace IO
} // namespace LapCut

#endif // RAIIFILEHANDLE_H
