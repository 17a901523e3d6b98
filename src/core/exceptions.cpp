/*
 * exceptions.cpp - Exception classes code
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

#include "lapcut.h"

namespace LapCut {
namespace Core {

const char* telemetryErrorName(TelemetryError error) {
    switch (error) {
        case TelemetryError::MALFORMED_MARKER_FILE:
            return "MalformedMarkerFile";
        case TelemetryError::EMPTY_MARKER_SET:
            return "EmptyMarkerSet";
        case TelemetryError::LAP_INDEX_OUT_OF_RANGE:
            return "LapIndexOutOfRange";
        case TelemetryError::INVALID_WINDOW:
            return "InvalidWindow";
        case TelemetryError::TRUNCATED_FILE:
            return "TruncatedFile";
        case TelemetryError::UNKNOWN_DATA_TYPE:
            return "UnknownDataType";
        case TelemetryError::OVERLAPPING_REGIONS:
            return "OverlappingRegions";
        case TelemetryError::UNSUPPORTED_LAYOUT:
            return "UnsupportedLayout";
        default:
            return "Unknown";
    }
}

/**
 * @brief Constructs a TelemetryException.
 *
 * Thrown by the container and marker codecs when input is malformed or a
 * request cannot be satisfied. Context (offset, expected, actual) can be
 * chained on afterwards and is appended to the message.
 * @param error The error code.
 * @param message A string describing the failure.
 */
TelemetryException::TelemetryException(TelemetryError error, const std::string& message)
    : std::runtime_error(message), m_error(error), m_message(message) {
    rebuildMessage();
}

const char* TelemetryException::what() const noexcept {
    return m_full_message.c_str();
}

TelemetryException& TelemetryException::at(uint64_t offset) {
    m_has_offset = true;
    m_offset = offset;
    rebuildMessage();
    return *this;
}

TelemetryException& TelemetryException::expected(const std::string& value) {
    m_expected = value;
    rebuildMessage();
    return *this;
}

TelemetryException& TelemetryException::actual(const std::string& value) {
    m_actual = value;
    rebuildMessage();
    return *this;
}

void TelemetryException::rebuildMessage() {
    std::ostringstream oss;
    oss << getErrorName() << ": " << m_message;
    if (m_has_offset) {
        oss << " (offset 0x" << std::hex << m_offset << std::dec << ")";
    }
    if (!m_expected.empty() || !m_actual.empty()) {
        oss << " - expected " << (m_expected.empty() ? "?" : m_expected)
            << ", got " << (m_actual.empty() ? "?" : m_actual);
    }
    m_full_message = oss.str();
}

/**
 * @brief Constructs an IOException.
 *
 * This exception is used for file system operations: opening, reading,
 * writing and renaming log files.
 * @param why A string describing the I/O error.
 */
IOException::IOException(const std::string &why)
    : std::exception(), m_why(why) {
  // ctor
}

/**
 * @brief Returns the exception's explanatory string.
 * @return A C-style string detailing the I/O error.
 */
const char *IOException::what() const noexcept { return m_why.c_str(); }

} // namespace Core
} // namespace LapCut
