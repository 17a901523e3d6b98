/*
 * Container.h - In-memory .ld telemetry log
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef CONTAINER_H
#define CONTAINER_H

// No direct includes - all includes should be in lapcut.h

namespace LapCut {
namespace Telemetry {

/**
 * @brief Event, venue and vehicle text decoded from the preamble
 *
 * Fields stay empty when the corresponding block is absent or its pointer
 * does not land inside the preamble.
 */
struct SessionInfo {
    std::string event_name;
    std::string session;
    std::string comment;
    std::string venue_name;
    std::string vehicle_id;
    uint32_t vehicle_weight = 0;
    std::string vehicle_type;
    std::string vehicle_comment;
};

/**
 * @brief A parsed .ld file: header, ordered channels and the opaque regions
 *
 * Channel order is significant: it fixes catalog and data block order when
 * the container is written. The preamble (bytes between the header and the
 * catalog), the padding between the catalog and the data region, and any
 * trailer after the last data block are carried verbatim.
 *
 * A Container is never edited in place by the codec; ChannelSlicer builds
 * a new one.
 */
class Container {
public:
    explicit Container(Header header,
                       std::vector<Channel> channels = {},
                       std::vector<uint8_t> preamble = {},
                       std::vector<uint8_t> catalog_padding = {},
                       std::vector<uint8_t> trailer = {});

    const Header& header() const { return m_header; }
    const std::vector<Channel>& channels() const { return m_channels; }
    size_t channelCount() const { return m_channels.size(); }

    const std::vector<uint8_t>& preamble() const { return m_preamble; }
    const std::vector<uint8_t>& catalogPadding() const { return m_catalog_padding; }
    const std::vector<uint8_t>& trailer() const { return m_trailer; }

    /**
     * @brief First channel with the given name, or nullptr
     */
    const Channel* findChannel(const std::string& name) const;

    /**
     * @brief Longest channel recording, in seconds
     */
    double duration() const;

    /**
     * @brief Decode the event/venue/vehicle blocks the header points into
     */
    SessionInfo sessionInfo() const;

private:
    Header m_header;
    std::vector<Channel> m_channels;
    std::vector<uint8_t> m_preamble;
    std::vector<uint8_t> m_catalog_padding;
    std::vector<uint8_t> m_trailer;
};

} // namespace Telemetry
} // namespace LapCut

#endif // CONTAINER_H
