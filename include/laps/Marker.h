/*
 * Marker.h - Beacon markers and lap boundaries
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef MARKER_H
#define MARKER_H

// No direct includes - all includes should be in lapcut.h

namespace LapCut {
namespace Laps {

/**
 * @brief Unit of the Time attribute in an .ldx file
 */
enum class TimeUnit {
    SECONDS,
    MICROSECONDS
};

const char* timeUnitName(TimeUnit unit);

/**
 * @brief Parse "s"/"seconds" or "us"/"microseconds"
 * @throws std::invalid_argument for anything else
 */
TimeUnit parseTimeUnit(const std::string& text);

/**
 * @brief Units per second (1 or 1e6); times are divided by this to get seconds
 */
double timeUnitsPerSecond(TimeUnit unit);

struct MarkerOptions {
    TimeUnit unit = TimeUnit::SECONDS;
};

/**
 * @brief A beacon crossing, time in seconds since session start
 */
struct Marker {
    std::string name;
    double time;
};

/**
 * @brief One lap between two consecutive markers
 */
struct LapBoundary {
    size_t lap_index;
    double start_time;
    double end_time;
    double duration;
};

} // namespace Laps
} // namespace LapCut

#endif // MARKER_H
