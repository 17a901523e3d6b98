/*
 * ChannelSlicer.h - Cut every channel of a Container to a time window
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef CHANNELSLICER_H
#define CHANNELSLICER_H

// No direct includes - all includes should be in lapcut.h

namespace LapCut {
namespace Telemetry {

/**
 * @brief Half-open time window [start, end) in seconds from session start
 */
struct TimeWindow {
    double start;
    double end;

    double duration() const { return end - start; }
};

/**
 * @brief Sample index range [begin, end) selected by a window
 */
struct SampleRange {
    size_t begin;
    size_t end;

    size_t count() const { return end - begin; }
};

class ChannelSlicer {
public:
    /**
     * @brief floor(time * frequency) clamped to [0, sample_count]
     *
     * Products within 1e-9 (relative) of an integer are snapped to it first,
     * so 22.5 s at 10 Hz is index 225 even if the product comes out as
     * 224.99999999999997.
     */
    static size_t sampleIndex(double time, uint16_t frequency, size_t sample_count);

    /**
     * @brief Index range of one channel; begin <= end always holds
     */
    static SampleRange sampleRange(const TimeWindow& window, uint16_t frequency, size_t sample_count);

    /**
     * @brief Build a new Container holding only samples inside the window
     *
     * Each channel is cut independently at its own frequency. Channels left
     * with no samples are kept with a sample count of zero. Header, preamble,
     * padding and trailer are carried over; the source is not modified.
     * @throws Core::TelemetryException INVALID_WINDOW if end <= start or a bound is not finite
     */
    static Container slice(const Container& source, const TimeWindow& window);
};

} // namespace Telemetry
} // namespace LapCut

#endif // CHANNELSLICER_H
