/*
 * MarkerParser.cpp - Read beacon markers from .ldx XML
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "lapcut.h"

namespace LapCut {
namespace Laps {

using Core::TelemetryError;
using Core::TelemetryException;
using Core::Utility::XMLUtil;

const char* timeUnitName(TimeUnit unit) {
    switch (unit) {
        case TimeUnit::SECONDS:      return "seconds";
        case TimeUnit::MICROSECONDS: return "microseconds";
    }
    return "unknown";
}

TimeUnit parseTimeUnit(const std::string& text) {
    if (text == "s" || text == "sec" || text == "seconds") {
        return TimeUnit::SECONDS;
    }
    if (text == "us" || text == "usec" || text == "microseconds") {
        return TimeUnit::MICROSECONDS;
    }
    throw std::invalid_argument("Unknown time unit: " + text);
}

double timeUnitsPerSecond(TimeUnit unit) {
    return unit == TimeUnit::MICROSECONDS ? 1e6 : 1.0;
}

std::vector<Marker> MarkerParser::parse(const std::string& xml, const MarkerOptions& options) {
    XMLUtil::Element root;
    try {
        root = XMLUtil::parseXML(xml);
    } catch (const std::runtime_error& e) {
        throw TelemetryException(TelemetryError::MALFORMED_MARKER_FILE,
                                 std::string("cannot parse marker XML: ") + e.what());
    }

    double per_second = timeUnitsPerSecond(options.unit);
    std::vector<Marker> markers;

    for (const XMLUtil::Element* element : XMLUtil::findDescendants(root, "Marker")) {
        const std::string* time = element->attribute("Time");
        if (!time) {
            continue;
        }
        const std::string* name = element->attribute("Name");

        Marker marker;
        marker.name = name ? *name : std::string();
        marker.time = parseTime(*time, markers.size()) / per_second;

        if (!markers.empty() && marker.time <= markers.back().time) {
            throw TelemetryException(TelemetryError::MALFORMED_MARKER_FILE,
                                     "marker " + std::to_string(markers.size()) +
                                     " is not later than the one before it")
                .expected("> " + std::to_string(markers.back().time))
                .actual(marker.time);
        }
        markers.push_back(std::move(marker));
    }

    if (markers.size() < 2) {
        throw TelemetryException(TelemetryError::EMPTY_MARKER_SET, "at least two markers are needed to form a lap")
            .expected(">= 2").actual(markers.size());
    }

    Debug::log("ldx", "Parsed ", markers.size(), " markers (", timeUnitName(options.unit), "), last at ",
               markers.back().time, " s");
    return markers;
}

std::vector<Marker> MarkerParser::parseFile(const std::string& path, const MarkerOptions& options) {
    Debug::log("ldx", "Reading markers from ", path);
    return parse(IO::readTextFile(path), options);
}

double MarkerParser::parseTime(const std::string& text, size_t marker_number) {
    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);

    bool consumed = end != begin;
    while (consumed && *end && std::isspace(static_cast<unsigned char>(*end))) {
        ++end;
    }
    if (!consumed || *end != '\0' || errno == ERANGE || !std::isfinite(value) || value < 0.0) {
        throw TelemetryException(TelemetryError::MALFORMED_MARKER_FILE,
                                 "marker " + std::to_string(marker_number) + " has an invalid Time")
            .expected("finite non-negative number").actual("\"" + text + "\"");
    }
    return value;
}

} // namespace Laps
} // namespace LapCut
