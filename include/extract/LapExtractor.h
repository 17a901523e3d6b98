/*
 * LapExtractor.h - Single-lap extraction pipeline
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef LAPEXTRACTOR_H
#define LAPEXTRACTOR_H

// No direct includes - all includes should be in lapcut.h

namespace LapCut {
namespace Extract {

struct ExtractOptions {
    Laps::TimeUnit marker_unit = Laps::TimeUnit::SECONDS;
};

/**
 * @brief What an extraction produced
 */
struct ExtractResult {
    Laps::LapBoundary lap;
    std::string ld_path;
    std::string ldx_path;
    size_t channel_count;
    uint64_t ld_bytes;
};

/**
 * @brief Parsed input pair, for display
 */
struct Inspection {
    Telemetry::Container container;
    std::vector<Laps::Marker> markers;
    std::vector<Laps::LapBoundary> laps;
};

/**
 * @brief Reads an .ld/.ldx pair, cuts one lap out and writes the new pair
 *
 * Both outputs are fully built in memory and staged beside their targets
 * before either is renamed into place. A failure at any step leaves no new
 * output behind, and files already at the output paths keep their contents. The extractor keeps no state between calls, so
 * separate instances may run concurrently on different files.
 */
class LapExtractor {
public:
    explicit LapExtractor(const ExtractOptions& options = ExtractOptions());

    /**
     * @throws Core::TelemetryException, Core::IOException
     */
    ExtractResult extract(const std::string& ld_path, const std::string& ldx_path,
                          const Laps::LapSelector& selector,
                          const std::string& out_ld_path, const std::string& out_ldx_path) const;

    /**
     * @brief In-memory form of extract(): slice a parsed container to one lap
     */
    Telemetry::Container extractLap(const Telemetry::Container& container,
                                    const std::vector<Laps::LapBoundary>& laps,
                                    const Laps::LapSelector& selector) const;

    /**
     * @throws Core::TelemetryException, Core::IOException
     */
    Inspection inspect(const std::string& ld_path, const std::string& ldx_path) const;

    const ExtractOptions& options() const { return m_options; }

private:
    ExtractOptions m_options;
};

} // namespace Extract
} // namespace LapCut

#endif // LAPEXTRACTOR_H
