/*
 * ContainerReader.cpp - Parse .ld bytes into a Container
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "lapcut.h"

namespace LapCut {
namespace Telemetry {

using namespace LDFormat;
using Core::TelemetryError;
using Core::TelemetryException;
using Core::Utility::readLE;

ContainerReader::ContainerReader(const std::vector<uint8_t>& data) : m_data(data) {
}

Container ContainerReader::read(const std::vector<uint8_t>& data) {
    return ContainerReader(data).read();
}

Container ContainerReader::readFile(const std::string& path) {
    std::vector<uint8_t> data = IO::readFile(path);
    Debug::log("ld", "Parsing ", path);
    return ContainerReader(data).read();
}

Container ContainerReader::read() const {
    Header header = readHeader();
    std::vector<ChannelDescriptor> descriptors = readCatalog(header);

    uint64_t catalog_end = static_cast<uint64_t>(header.metaPtr()) +
                           descriptors.size() * CHANNEL_RECORD_SIZE;
    uint32_t data_ptr = header.dataPtr();
    if (data_ptr < catalog_end) {
        throw TelemetryException(TelemetryError::OVERLAPPING_REGIONS,
                                 "data region starts inside the channel catalog")
            .at(HDR_DATA_PTR).expected(">= " + std::to_string(catalog_end)).actual(data_ptr);
    }
    requireBytes(data_ptr, 0, "data region");

    checkDataBlocks(descriptors, data_ptr);

    std::vector<Channel> channels;
    channels.reserve(descriptors.size());
    uint64_t data_end = data_ptr;
    for (auto& descriptor : descriptors) {
        ChannelBuffer buffer = ChannelBuffer::decode(descriptor.sampleType(),
                                                     m_data.data() + descriptor.dataPtr(),
                                                     descriptor.sampleCount());
        data_end += descriptor.dataByteLength();
        DEBUG_LOG_LAZY("ld", "Channel '", descriptor.name(), "' ", sampleTypeName(descriptor.sampleType()),
                       " ", descriptor.frequency(), " Hz, ", descriptor.sampleCount(), " samples at ",
                       descriptor.dataPtr());
        channels.emplace_back(std::move(descriptor), std::move(buffer));
    }

    if (header.channelCount() != channels.size()) {
        Debug::log("ld", "Header declares ", header.channelCount(), " channels but the catalog holds ",
                   channels.size(), "; the true count is written back");
    }

    std::vector<uint8_t> preamble = bytes(HEADER_SIZE, header.metaPtr() - HEADER_SIZE);
    std::vector<uint8_t> padding = bytes(catalog_end, data_ptr - catalog_end);
    std::vector<uint8_t> trailer = bytes(data_end, m_data.size() - data_end);

    Debug::log("ld", "Parsed ", channels.size(), " channels, preamble ", preamble.size(),
               " bytes, padding ", padding.size(), " bytes, trailer ", trailer.size(), " bytes");

    return Container(std::move(header), std::move(channels), std::move(preamble),
                     std::move(padding), std::move(trailer));
}

Header ContainerReader::readHeader() const {
    if (m_data.size() < HEADER_SIZE) {
        throw TelemetryException(TelemetryError::TRUNCATED_FILE, "file is shorter than the header")
            .at(0).expected(HEADER_SIZE).actual(m_data.size());
    }

    Header header(bytes(0, HEADER_SIZE));

    if (header.marker() != HEADER_MARKER) {
        std::ostringstream actual;
        actual << "0x" << std::hex << header.marker();
        throw TelemetryException(TelemetryError::UNSUPPORTED_LAYOUT, "bad header marker")
            .at(HDR_MARKER).expected("0x40").actual(actual.str());
    }

    uint32_t meta_ptr = header.metaPtr();
    if (meta_ptr < HEADER_SIZE) {
        throw TelemetryException(TelemetryError::OVERLAPPING_REGIONS,
                                 "channel catalog starts inside the header")
            .at(HDR_META_PTR).expected(">= " + std::to_string(HEADER_SIZE)).actual(meta_ptr);
    }
    requireBytes(meta_ptr, 0, "channel catalog");

    uint32_t event_ptr = header.eventPtr();
    if (event_ptr != 0 && (event_ptr < HEADER_SIZE || event_ptr >= meta_ptr)) {
        throw TelemetryException(TelemetryError::UNSUPPORTED_LAYOUT,
                                 "event block lies outside the preamble")
            .at(HDR_EVENT_PTR)
            .expected("[" + std::to_string(HEADER_SIZE) + ", " + std::to_string(meta_ptr) + ")")
            .actual(event_ptr);
    }

    Debug::log("ld", "Header: ", header.deviceType(), " v", header.deviceVersion(), ", ",
               header.channelCount(), " channels declared, catalog at ", meta_ptr,
               ", data at ", header.dataPtr());
    return header;
}

std::vector<ChannelDescriptor> ContainerReader::readCatalog(const Header& header) const {
    std::vector<ChannelDescriptor> descriptors;
    uint64_t meta_ptr = header.metaPtr();

    // A channel-less log has no record between the catalog and data pointers
    if (header.channelCount() == 0 && header.dataPtr() >= meta_ptr &&
        header.dataPtr() - meta_ptr < CHANNEL_RECORD_SIZE) {
        return descriptors;
    }

    uint64_t offset = meta_ptr;
    uint32_t expected_prev = 0;
    while (true) {
        requireBytes(offset, CHANNEL_RECORD_SIZE, "channel record");
        ChannelDescriptor descriptor(bytes(offset, CHANNEL_RECORD_SIZE), offset);

        if (descriptor.prevPtr() != expected_prev) {
            throw TelemetryException(TelemetryError::UNSUPPORTED_LAYOUT, "broken catalog back link")
                .at(offset + CH_PREV_PTR).expected(expected_prev).actual(descriptor.prevPtr());
        }

        uint32_t next = descriptor.nextPtr();
        descriptors.push_back(std::move(descriptor));
        if (next == 0) {
            break;
        }

        uint64_t contiguous = offset + CHANNEL_RECORD_SIZE;
        if (next != contiguous) {
            throw TelemetryException(TelemetryError::UNSUPPORTED_LAYOUT, "catalog records are not contiguous")
                .at(offset + CH_NEXT_PTR).expected(contiguous).actual(next);
        }
        expected_prev = static_cast<uint32_t>(offset);
        offset = contiguous;
    }

    return descriptors;
}

void ContainerReader::checkDataBlocks(const std::vector<ChannelDescriptor>& descriptors,
                                      uint32_t data_ptr) const {
    struct Block {
        uint64_t begin;
        uint64_t end;
        size_t index;
    };
    std::vector<Block> blocks;

    for (size_t i = 0; i < descriptors.size(); ++i) {
        const auto& descriptor = descriptors[i];
        uint64_t begin = descriptor.dataPtr();
        uint64_t length = descriptor.dataByteLength();
        requireBytes(begin, length, "data block of channel '" + descriptor.name() + "'");

        if (length == 0) {
            continue;
        }
        if (begin < data_ptr) {
            throw TelemetryException(TelemetryError::OVERLAPPING_REGIONS,
                                     "data block of channel '" + descriptor.name() + "' precedes the data region")
                .at(begin).expected(">= " + std::to_string(data_ptr)).actual(begin);
        }
        blocks.push_back({begin, begin + length, i});
    }

    std::sort(blocks.begin(), blocks.end(),
              [](const Block& a, const Block& b) { return a.begin < b.begin; });
    for (size_t i = 1; i < blocks.size(); ++i) {
        if (blocks[i].begin < blocks[i - 1].end) {
            throw TelemetryException(TelemetryError::OVERLAPPING_REGIONS,
                                     "data blocks of channels '" + descriptors[blocks[i - 1].index].name() +
                                     "' and '" + descriptors[blocks[i].index].name() + "' overlap")
                .at(blocks[i].begin).expected(">= " + std::to_string(blocks[i - 1].end)).actual(blocks[i].begin);
        }
    }

    // Blocks must be packed back to back in catalog order, starting at data_ptr
    uint64_t cursor = data_ptr;
    for (const auto& descriptor : descriptors) {
        if (descriptor.dataPtr() != cursor) {
            throw TelemetryException(TelemetryError::UNSUPPORTED_LAYOUT,
                                     "data block of channel '" + descriptor.name() + "' is not packed in catalog order")
                .at(descriptor.dataPtr()).expected(cursor).actual(descriptor.dataPtr());
        }
        cursor += descriptor.dataByteLength();
    }
}

void ContainerReader::requireBytes(uint64_t offset, uint64_t length, const std::string& what) const {
    uint64_t size = m_data.size();
    if (offset > size || size - offset < length) {
        throw TelemetryException(TelemetryError::TRUNCATED_FILE, what + " extends past end of file")
            .at(offset).expected(offset + length).actual(size);
    }
}

std::vector<uint8_t> ContainerReader::bytes(uint64_t offset, uint64_t length) const {
    requireBytes(offset, length, "region");
    auto begin = m_data.begin() + static_cast<std::ptrdiff_t>(offset);
    return std::vector<uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(length));
}

} // namespace Telemetry
} // namespace LapCut
