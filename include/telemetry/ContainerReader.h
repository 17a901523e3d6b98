/*
 * ContainerReader.h - Parse .ld bytes into a Container
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef CONTAINERREADER_H
#define CONTAINERREADER_H

// No direct includes - all includes should be in lapcut.h

namespace LapCut {
namespace Telemetry {

/**
 * @brief Parser for complete in-memory .ld images
 *
 * Every field is read at an offset computed from fields already parsed;
 * there is no shared cursor. The source bytes are never modified.
 *
 * Validation:
 * - TRUNCATED_FILE: header, catalog record or data block extends past EOF
 * - OVERLAPPING_REGIONS: catalog inside the header, data region inside the
 *   catalog, or two data blocks sharing bytes
 * - UNKNOWN_DATA_TYPE: a record with an unsupported type class/width
 * - UNSUPPORTED_LAYOUT: bad header marker, event block outside the
 *   preamble, non-contiguous or mislinked catalog, data blocks that are not
 *   packed in catalog order from the data pointer
 */
class ContainerReader {
public:
    explicit ContainerReader(const std::vector<uint8_t>& data);

    /**
     * @brief Parse the whole image
     * @throws Core::TelemetryException
     */
    Container read() const;

    /**
     * @brief Convenience: parse a byte buffer
     */
    static Container read(const std::vector<uint8_t>& data);

    /**
     * @brief Convenience: load and parse a file
     * @throws Core::IOException, Core::TelemetryException
     */
    static Container readFile(const std::string& path);

private:
    Header readHeader() const;
    std::vector<ChannelDescriptor> readCatalog(const Header& header) const;
    void checkDataBlocks(const std::vector<ChannelDescriptor>& descriptors, uint32_t data_ptr) const;

    void requireBytes(uint64_t offset, uint64_t length, const std::string& what) const;
    std::vector<uint8_t> bytes(uint64_t offset, uint64_t length) const;

    const std::vector<uint8_t>& m_data;
};

} // namespace Telemetry
} // namespace LapCut

#endif // CONTAINERREADER_H
