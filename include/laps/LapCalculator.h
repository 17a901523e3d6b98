/*
 * LapCalculator.h - Lap boundaries from beacon markers
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef LAPCALCULATOR_H
#define LAPCALCULATOR_H

// No direct includes - all includes should be in lapcut.h

namespace LapCut {
namespace Laps {

/**
 * @brief Which lap to extract: a 0-based index, or the fastest one
 */
class LapSelector {
public:
    static LapSelector index(size_t lap_index) { return LapSelector(false, lap_index); }
    static LapSelector fastest() { return LapSelector(true, 0); }

    bool isFastest() const { return m_fastest; }
    size_t lapIndex() const { return m_index; }

    std::string describe() const;

private:
    LapSelector(bool fastest, size_t index) : m_fastest(fastest), m_index(index) {}

    bool m_fastest;
    size_t m_index;
};

class LapCalculator {
public:
    /**
     * @brief One lap per consecutive marker pair
     *
     * Lap i runs from markers[i] to markers[i + 1]; the end of one lap is
     * the start of the next.
     * @throws Core::TelemetryException EMPTY_MARKER_SET for fewer than two markers
     * @throws Core::TelemetryException MALFORMED_MARKER_FILE if times do not increase
     */
    static std::vector<LapBoundary> computeLaps(const std::vector<Marker>& markers);

    /**
     * @throws Core::TelemetryException LAP_INDEX_OUT_OF_RANGE if lap_index >= laps.size()
     */
    static const LapBoundary& selectIndex(const std::vector<LapBoundary>& laps, size_t lap_index);

    /**
     * @brief Lap with the smallest duration; the earliest wins a tie
     * @throws Core::TelemetryException EMPTY_MARKER_SET if laps is empty
     */
    static const LapBoundary& selectFastest(const std::vector<LapBoundary>& laps);

    static const LapBoundary& select(const std::vector<LapBoundary>& laps, const LapSelector& selector);
};

/**
 * @brief Format seconds as m:ss.mmm (e.g. 93.367 -> "1:33.367")
 */
std::string formatLapTime(double seconds);

} // namespace Laps
} // namespace LapCut

#endif // LAPCALCULATOR_H
