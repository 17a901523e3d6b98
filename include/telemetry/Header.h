/*
 * Header.h - .ld file header
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HEADER_H
#define HEADER_H

// No direct includes - all includes should be in lapcut.h

namespace LapCut {
namespace Telemetry {

/**
 * @brief The fixed 1762-byte header at the start of every .ld file
 *
 * The header keeps its full raw byte image. Named fields are read from and
 * written into that image at their fixed offsets, so every byte this class
 * does not know about survives a read/write cycle untouched.
 */
class Header {
public:
    /**
     * @brief Zero-filled header image (marker and static words not set)
     */
    Header();

    /**
     * @brief Wrap an existing header image
     * @throws std::invalid_argument if raw is not exactly HEADER_SIZE bytes
     */
    explicit Header(std::vector<uint8_t> raw);

    /**
     * @brief Build a header carrying the constants an ADL logger writes
     *
     * Pointers and the channel count are left at zero; ContainerWriter fills
     * them in from the layout it computes.
     */
    static Header create(const std::string& driver, const std::string& vehicle_id,
                         const std::string& venue, const std::string& date,
                         const std::string& time);

    const std::vector<uint8_t>& raw() const { return m_raw; }

    uint32_t marker() const;
    uint32_t metaPtr() const;
    uint32_t dataPtr() const;
    uint32_t eventPtr() const;
    uint32_t serial() const;
    std::string deviceType() const;
    uint16_t deviceVersion() const;
    uint32_t channelCount() const;
    std::string date() const;
    std::string time() const;
    std::string driver() const;
    std::string vehicleId() const;
    std::string venue() const;
    std::string shortComment() const;

    // Layout fields, rewritten by ContainerWriter
    void setMetaPtr(uint32_t ptr);
    void setDataPtr(uint32_t ptr);
    void setChannelCount(uint32_t count);

    void setDriver(const std::string& driver);
    void setVehicleId(const std::string& vehicle_id);
    void setVenue(const std::string& venue);
    void setDate(const std::string& date);
    void setTime(const std::string& time);
    void setShortComment(const std::string& comment);

private:
    std::vector<uint8_t> m_raw;
};

} // namespace Telemetry
} // namespace LapCut

#endif // HEADER_H
