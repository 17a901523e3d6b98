/*
 * LapCalculator.cpp - Lap boundaries from beacon markers
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

std::string LapSelector::describe() const {
    if (m_fastest) {
        return "fastest lap";
    }
    return "lap " + std::to_string(m_index);
}

std::vector<LapBoundary> LapCalculator::computeLaps(const std::vector<Marker>& markers) {
    if (markers.size() < 2) {
        throw TelemetryException(TelemetryError::EMPTY_MARKER_SET, "at least two markers are needed to form a lap")
            .expected(">= 2").actual(markers.size());
    }

    std::vector<LapBoundary> laps;
    laps.reserve(markers.size() - 1);
    for (size_t i = 0; i + 1 < markers.size(); ++i) {
        double start = markers[i].time;
        double end = markers[i + 1].time;
        if (!(end > start)) {
            throw TelemetryException(TelemetryError::MALFORMED_MARKER_FILE,
                                     "marker " + std::to_string(i + 1) + " is not later than the one before it")
                .expected("> " + std::to_string(start)).actual(end);
        }
        laps.push_back({i, start, end, end - start});
        DEBUG_LOG_LAZY("laps", "Lap ", i, ": ", start, " -> ", end, " (", formatLapTime(end - start), ")");
    }

    return laps;
}

const LapBoundary& LapCalculator::selectIndex(const std::vector<LapBoundary>& laps, size_t lap_index) {
    if (lap_index >= laps.size()) {
        throw TelemetryException(TelemetryError::LAP_INDEX_OUT_OF_RANGE,
                                 "lap " + std::to_string(lap_index) + " does not exist")
            .expected("< " + std::to_string(laps.size())).actual(lap_index);
    }
    return laps[lap_index];
}

const LapBoundary& LapCalculator::selectFastest(const std::vector<LapBoundary>& laps) {
    if (laps.empty()) {
        throw TelemetryException(TelemetryError::EMPTY_MARKER_SET, "no laps to choose from");
    }

    // Strict comparison keeps the earliest lap on a tie
    size_t best = 0;
    for (size_t i = 1; i < laps.size(); ++i) {
        if (laps[i].duration < laps[best].duration) {
            best = i;
        }
    }

    Debug::log("laps", "Fastest is lap ", best, " of ", laps.size(), " at ", formatLapTime(laps[best].duration));
    return laps[best];
}

const LapBoundary& LapCalculator::select(const std::vector<LapBoundary>& laps, const LapSelector& selector) {
    if (selector.isFastest()) {
        return selectFastest(laps);
    }
    return selectIndex(laps, selector.lapIndex());
}

std::string formatLapTime(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        return "-:--.---";
    }

    // Round to whole milliseconds first so 59.9996 becomes 1:00.000, not 0:60.000
    long long total_ms = std::llround(seconds * 1000.0);
    long long minutes = total_ms / 60000;
    long long ms = total_ms % 60000;

    std::ostringstream oss;
    oss << minutes << ':' << std::setw(2) << std::setfill('0') << (ms / 1000)
        << '.' << std::setw(3) << std::setfill('0') << (ms % 1000);
    return oss.str();
}

} // namespace Laps
} // namespace LapCut
