/*
 * ContainerWriter.cpp - Serialize a Container into .ld bytes
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

namespace {

uint32_t checkedOffset(uint64_t offset) {
    if (offset > std::numeric_limits<uint32_t>::max()) {
        throw TelemetryException(TelemetryError::UNSUPPORTED_LAYOUT,
                                 "container does not fit 32-bit file offsets")
            .expected("<= 4294967295").actual(offset);
    }
    return static_cast<uint32_t>(offset);
}

} // namespace

ContainerLayout ContainerWriter::computeLayout(const Container& c) {
    ContainerLayout layout;
    const auto& channels = c.channels();

    uint64_t offset = HEADER_SIZE + c.preamble().size();
    layout.meta_ptr = checkedOffset(offset);

    for (size_t i = 0; i < channels.size(); ++i) {
        layout.record_offsets.push_back(checkedOffset(offset));
        offset += CHANNEL_RECORD_SIZE;
    }

    offset += c.catalogPadding().size();
    layout.data_ptr = checkedOffset(offset);

    for (const auto& channel : channels) {
        layout.data_offsets.push_back(checkedOffset(offset));
        offset += channel.buffer().byteLength();
    }

    layout.trailer_offset = checkedOffset(offset);
    layout.total_size = checkedOffset(offset + c.trailer().size());
    return layout;
}

std::vector<uint8_t> ContainerWriter::write(const Container& c) {
    ContainerLayout layout = computeLayout(c);
    const auto& channels = c.channels();

    std::vector<uint8_t> out;
    out.reserve(layout.total_size);

    Header header = c.header();
    header.setMetaPtr(layout.meta_ptr);
    header.setDataPtr(layout.data_ptr);
    header.setChannelCount(static_cast<uint32_t>(channels.size()));
    out.insert(out.end(), header.raw().begin(), header.raw().end());

    out.insert(out.end(), c.preamble().begin(), c.preamble().end());

    for (size_t i = 0; i < channels.size(); ++i) {
        ChannelDescriptor record = channels[i].descriptor();
        uint32_t prev = (i == 0) ? 0 : layout.record_offsets[i - 1];
        uint32_t next = (i + 1 == channels.size()) ? 0 : layout.record_offsets[i + 1];
        record.setLinks(prev, next);
        record.setDataPtr(layout.data_offsets[i]);
        record.setSampleCount(static_cast<uint32_t>(channels[i].sampleCount()));
        out.insert(out.end(), record.raw().begin(), record.raw().end());
    }

    out.insert(out.end(), c.catalogPadding().begin(), c.catalogPadding().end());

    for (const auto& channel : channels) {
        channel.buffer().encode(out);
    }

    out.insert(out.end(), c.trailer().begin(), c.trailer().end());

    if (out.size() != layout.total_size) {
        throw std::logic_error("ContainerWriter emitted " + std::to_string(out.size()) +
                               " bytes, layout computed " + std::to_string(layout.total_size));
    }

    Debug::log("ld", "Serialized ", channels.size(), " channels into ", out.size(), " bytes (catalog at ",
               layout.meta_ptr, ", data at ", layout.data_ptr, ")");
    return out;
}

void ContainerWriter::writeFile(const Container& c, const std::string& path) {
    IO::writeFileAtomically(path, write(c));
}

} // namespace Telemetry
} // namespace LapCut
