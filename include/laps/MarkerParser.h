/*
 * MarkerParser.h - Read beacon markers from .ldx XML
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef MARKERPARSER_H
#define MARKERPARSER_H

// No direct includes - all includes should be in lapcut.h

namespace LapCut {
namespace Laps {

/**
 * @brief Extracts the ordered beacon timestamps from an .ldx document
 *
 * Every Marker element with a Time attribute is taken, wherever it sits in
 * the tree (MarkerGroup or the older Markers element), in document order.
 * Names are carried through but never interpreted.
 */
class MarkerParser {
public:
    /**
     * @throws Core::TelemetryException MALFORMED_MARKER_FILE for unparseable XML,
     *         a non-numeric, negative or non-finite Time, or times that are not
     *         strictly increasing
     * @throws Core::TelemetryException EMPTY_MARKER_SET for fewer than two markers
     */
    static std::vector<Marker> parse(const std::string& xml, const MarkerOptions& options = MarkerOptions());

    /**
     * @throws Core::IOException, Core::TelemetryException
     */
    static std::vector<Marker> parseFile(const std::string& path, const MarkerOptions& options = MarkerOptions());

private:
    static double parseTime(const std::string& text, size_t marker_number);
};

} // namespace Laps
} // namespace LapCut

#endif // MARKERPARSER_H
