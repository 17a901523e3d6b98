/*
 * ContainerWriter.h - Serialize a Container into .ld bytes
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef CONTAINERWRITER_H
#define CONTAINERWRITER_H

// No direct includes - all includes should be in lapcut.h

namespace LapCut {
namespace Telemetry {

/**
 * @brief Every offset of an output file, computed before any byte is emitted
 */
struct ContainerLayout {
    uint32_t meta_ptr = 0;
    uint32_t data_ptr = 0;
    std::vector<uint32_t> record_offsets;
    std::vector<uint32_t> data_offsets;
    uint32_t trailer_offset = 0;
    uint32_t total_size = 0;
};

/**
 * @brief Writes a Container back into the .ld layout
 *
 * Output order is fixed: header, preamble, catalog, catalog padding, data
 * blocks in catalog order, trailer. The header's catalog pointer, data
 * pointer and channel count, and every record's links, data pointer and
 * sample count, are rewritten from the computed layout. A container read
 * from disk and written unchanged reproduces the source bytes exactly.
 */
class ContainerWriter {
public:
    /**
     * @brief Compute the layout of c without emitting anything
     * @throws Core::TelemetryException UNSUPPORTED_LAYOUT if the file would exceed 4 GiB
     */
    static ContainerLayout computeLayout(const Container& c);

    static std::vector<uint8_t> write(const Container& c);

    /**
     * @brief Serialize and write through a temporary file + rename
     * @throws Core::IOException, Core::TelemetryException
     */
    static void writeFile(const Container& c, const std::string& path);
};

} // namespace Telemetry
} // namespace LapCut

#endif // CONTAINERWRITER_H
