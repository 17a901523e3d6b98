/*
 * Header.cpp - .ld file header
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
using Core::Utility::writeLE;
using Core::Utility::readFixedString;
using Core::Utility::writeFixedString;

Header::Header() : m_raw(HEADER_SIZE, 0) {
}

Header::Header(std::vector<uint8_t> raw) : m_raw(std::move(raw)) {
    if (m_raw.size() != HEADER_SIZE) {
        throw std::invalid_argument("Header image must be " + std::to_string(HEADER_SIZE) +
                                    " bytes, got " + std::to_string(m_raw.size()));
    }
}

Header Header::create(const std::string& driver, const std::string& vehicle_id,
                      const std::string& venue, const std::string& date,
                      const std::string& time) {
    Header header;
    writeLE<uint32_t>(header.m_raw, HDR_MARKER, HEADER_MARKER);
    writeLE<uint16_t>(header.m_raw, HDR_STATIC_WORDS, STATIC_WORD_0);
    writeLE<uint16_t>(header.m_raw, HDR_STATIC_WORDS + 2, STATIC_WORD_1);
    writeLE<uint16_t>(header.m_raw, HDR_STATIC_WORDS + 4, STATIC_WORD_2);
    writeLE<uint32_t>(header.m_raw, HDR_SERIAL, DEFAULT_SERIAL);
    writeFixedString(header.m_raw, HDR_DEVICE_TYPE, DEVICE_TYPE_WIDTH, "ADL");
    writeLE<uint16_t>(header.m_raw, HDR_DEVICE_VERSION, DEFAULT_VERSION);
    writeLE<uint16_t>(header.m_raw, HDR_STATIC_ADB0, STATIC_ADB0);
    writeLE<uint32_t>(header.m_raw, HDR_PRO_LOGGING, PRO_LOGGING_MAGIC);

    header.setDriver(driver);
    header.setVehicleId(vehicle_id);
    header.setVenue(venue);
    header.setDate(date);
    header.setTime(time);
    return header;
}

uint32_t Header::marker() const { return readLE<uint32_t>(m_raw, HDR_MARKER); }
uint32_t Header::metaPtr() const { return readLE<uint32_t>(m_raw, HDR_META_PTR); }
uint32_t Header::dataPtr() const { return readLE<uint32_t>(m_raw, HDR_DATA_PTR); }
uint32_t Header::eventPtr() const { return readLE<uint32_t>(m_raw, HDR_EVENT_PTR); }
uint32_t Header::serial() const { return readLE<uint32_t>(m_raw, HDR_SERIAL); }
uint16_t Header::deviceVersion() const { return readLE<uint16_t>(m_raw, HDR_DEVICE_VERSION); }
uint32_t Header::channelCount() const { return readLE<uint32_t>(m_raw, HDR_CHANNEL_COUNT); }

std::string Header::deviceType() const {
    return readFixedString(m_raw, HDR_DEVICE_TYPE, DEVICE_TYPE_WIDTH);
}

std::string Header::date() const { return readFixedString(m_raw, HDR_DATE, DATE_WIDTH); }
std::string Header::time() const { return readFixedString(m_raw, HDR_TIME, TIME_WIDTH); }
std::string Header::driver() const { return readFixedString(m_raw, HDR_DRIVER, NAME64_WIDTH); }
std::string Header::vehicleId() const { return readFixedString(m_raw, HDR_VEHICLE_ID, NAME64_WIDTH); }
std::string Header::venue() const { return readFixedString(m_raw, HDR_VENUE, NAME64_WIDTH); }

std::string Header::shortComment() const {
    return readFixedString(m_raw, HDR_SHORT_COMMENT, NAME64_WIDTH);
}

void Header::setMetaPtr(uint32_t ptr) { writeLE<uint32_t>(m_raw, HDR_META_PTR, ptr); }
void Header::setDataPtr(uint32_t ptr) { writeLE<uint32_t>(m_raw, HDR_DATA_PTR, ptr); }
void Header::setChannelCount(uint32_t count) { writeLE<uint32_t>(m_raw, HDR_CHANNEL_COUNT, count); }

void Header::setDriver(const std::string& driver) {
    writeFixedString(m_raw, HDR_DRIVER, NAME64_WIDTH, driver);
}

void Header::setVehicleId(const std::string& vehicle_id) {
    writeFixedString(m_raw, HDR_VEHICLE_ID, NAME64_WIDTH, vehicle_id);
}

void Header::setVenue(const std::string& venue) {
    writeFixedString(m_raw, HDR_VENUE, NAME64_WIDTH, venue);
}

void Header::setDate(const std::string& date) {
    writeFixedString(m_raw, HDR_DATE, DATE_WIDTH, date);
}

void Header::setTime(const std::string& time) {
    writeFixedString(m_raw, HDR_TIME, TIME_WIDTH, time);
}

void Header::setShortComment(const std::string& comment) {
    writeFixedString(m_raw, HDR_SHORT_COMMENT, NAME64_WIDTH, comment);
}

} // namespace Telemetry
} // namespace LapCut
