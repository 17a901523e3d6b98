/*
 * exceptions.h - Various exception classes.
 * This file is part of LapCut.
 * Copyright © 2011-2026 Kirn Gill <segin2005@gmail.com>
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

#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

// No direct includes - all includes should be in lapcut.h

namespace LapCut {
namespace Core {

/**
 * @brief Error codes for telemetry codec and lap extraction operations
 *
 * None of these are transient. Each aborts the single operation that
 * raised it; no output file is written.
 */
enum class TelemetryError {
    /**
     * @brief Marker timestamps unreadable, negative, or not strictly increasing
     */
    MALFORMED_MARKER_FILE,

    /**
     * @brief Fewer than two markers, so no lap can be formed
     */
    EMPTY_MARKER_SET,

    /**
     * @brief Requested lap index is not below the lap count
     */
    LAP_INDEX_OUT_OF_RANGE,

    /**
     * @brief Slice window with end <= start (or non-finite bounds)
     */
    INVALID_WINDOW,

    /**
     * @brief A pointer or declared length reaches past the end of the file
     */
    TRUNCATED_FILE,

    /**
     * @brief Channel descriptor names a type class/width pair we cannot decode
     */
    UNKNOWN_DATA_TYPE,

    /**
     * @brief Two regions (header, catalog, data blocks) share bytes
     */
    OVERLAPPING_REGIONS,

    /**
     * @brief Well-formed but not in the single supported structural layout
     */
    UNSUPPORTED_LAYOUT
};

/**
 * @brief Get the canonical name of a telemetry error code
 */
const char* telemetryErrorName(TelemetryError error);

/**
 * @brief Exception class for telemetry codec errors
 *
 * Carries the error code and, where meaningful, the file offset and an
 * expected/actual pair. The context is folded into what() so a caller can
 * log the exception directly.
 *
 * USAGE:
 * ======
 * throw TelemetryException(TelemetryError::TRUNCATED_FILE, "channel data block")
 *           .at(offset).expected(needed).actual(file_size);
 */
class TelemetryException : public std::runtime_error {
public:
    TelemetryException(TelemetryError error, const std::string& message);

    TelemetryError getError() const { return m_error; }
    const char* getErrorName() const { return telemetryErrorName(m_error); }

    bool hasOffset() const { return m_has_offset; }
    uint64_t getOffset() const { return m_offset; }
    const std::string& getExpected() const { return m_expected; }
    const std::string& getActual() const { return m_actual; }

    const char* what() const noexcept override;

    // Context builders, chained onto a freshly constructed exception.
    TelemetryException& at(uint64_t offset);
    TelemetryException& expected(const std::string& value);
    TelemetryException& actual(const std::string& value);

    template<typename T>
    TelemetryException& expected(T value) { return expected(toString(value)); }
    template<typename T>
    TelemetryException& actual(T value) { return actual(toString(value)); }

private:
    template<typename T>
    static std::string toString(T value) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }

    void rebuildMessage();

    TelemetryError m_error;
    std::string m_message;
    bool m_has_offset = false;
    uint64_t m_offset = 0;
    std::string m_expected;
    std::string m_actual;
    std::string m_full_message;
};

// General file I/O failure (open, read, write, rename)
class IOException : public std::exception
{
    public:
        IOException(const std::string &why);
        ~IOException() noexcept override = default;
        const char *what() const noexcept override;
    protected:
    private:
        std::string m_why;
};

} // namespace Core
} // namespace LapCut

#endif // EXCEPTIONS_H
