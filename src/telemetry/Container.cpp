/*
 * Container.cpp - In-memory .ld telemetry log
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
using Core::Utility::readLE;
using Core::Utility::readFixedString;

Container::Container(Header header, std::vector<Channel> channels, std::vector<uint8_t> preamble,
                     std::vector<uint8_t> catalog_padding, std::vector<uint8_t> trailer)
    : m_header(std::move(header)),
      m_channels(std::move(channels)),
      m_preamble(std::move(preamble)),
      m_catalog_padding(std::move(catalog_padding)),
      m_trailer(std::move(trailer)) {
}

const Channel* Container::findChannel(const std::string& name) const {
    for (const auto& channel : m_channels) {
        if (channel.name() == name) {
            return &channel;
        }
    }
    return nullptr;
}

double Container::duration() const {
    double longest = 0.0;
    for (const auto& channel : m_channels) {
        longest = std::max(longest, channel.duration());
    }
    return longest;
}

SessionInfo Container::sessionInfo() const {
    SessionInfo info;

    // Block pointers are absolute file offsets; the preamble starts right
    // after the header. Returns the preamble-relative offset of a block of
    // the given size, or npos if it does not fit.
    auto locate = [this](uint64_t file_ptr, size_t block_size) -> size_t {
        if (file_ptr < HEADER_SIZE) {
            return std::string::npos;
        }
        uint64_t relative = file_ptr - HEADER_SIZE;
        if (relative > m_preamble.size() || m_preamble.size() - relative < block_size) {
            return std::string::npos;
        }
        return static_cast<size_t>(relative);
    };

    size_t event = locate(m_header.eventPtr(), EVENT_BLOCK_SIZE);
    if (event == std::string::npos) {
        return info;
    }
    info.event_name = readFixedString(m_preamble, event + EVT_NAME, NAME64_WIDTH);
    info.session = readFixedString(m_preamble, event + EVT_SESSION, NAME64_WIDTH);
    info.comment = readFixedString(m_preamble, event + EVT_COMMENT, EVT_COMMENT_WIDTH);

    size_t venue = locate(readLE<uint16_t>(m_preamble, event + EVT_VENUE_PTR), VENUE_BLOCK_SIZE);
    if (venue == std::string::npos) {
        return info;
    }
    info.venue_name = readFixedString(m_preamble, venue + VEN_NAME, NAME64_WIDTH);

    size_t vehicle = locate(readLE<uint16_t>(m_preamble, venue + VEN_VEHICLE_PTR), VEHICLE_BLOCK_SIZE);
    if (vehicle == std::string::npos) {
        return info;
    }
    info.vehicle_id = readFixedString(m_preamble, vehicle + VEH_ID, NAME64_WIDTH);
    info.vehicle_weight = readLE<uint32_t>(m_preamble, vehicle + VEH_WEIGHT);
    info.vehicle_type = readFixedString(m_preamble, vehicle + VEH_TYPE, VEH_TEXT_WIDTH);
    info.vehicle_comment = readFixedString(m_preamble, vehicle + VEH_COMMENT, VEH_TEXT_WIDTH);
    return info;
}

} // namespace Telemetry
} // namespace LapCut
