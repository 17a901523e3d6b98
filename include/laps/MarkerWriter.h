/*
 * MarkerWriter.h - Emit a single-lap .ldx document
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef MARKERWRITER_H
#define MARKERWRITER_H

// No direct includes - all includes should be in lapcut.h

namespace LapCut {
namespace Laps {

/**
 * @brief Writes the companion file of an extracted lap
 *
 * The document holds exactly two beacon markers, at 0 and at the lap
 * duration, and a Details block naming the lap as the only and fastest one.
 */
class MarkerWriter {
public:
    /**
     * @throws Core::TelemetryException INVALID_WINDOW if duration is not a positive finite number
     */
    static std::string write(double duration, const MarkerOptions& options = MarkerOptions());

    static void writeFile(const std::string& path, double duration, const MarkerOptions& options = MarkerOptions());

    /**
     * @brief Shortest decimal text that parses back to exactly value
     */
    static std::string formatNumber(double value);
};

} // namespace Laps
} // namespace LapCut

#endif // MARKERWRITER_H
