/*
 * LapExtractor.cpp - Single-lap extraction pipeline
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "lapcut.h"

namespace LapCut {
namespace Extract {

using Laps::LapBoundary;
using Laps::LapCalculator;
using Laps::LapSelector;
using Laps::MarkerOptions;
using Laps::MarkerParser;
using Laps::MarkerWriter;
using Telemetry::ChannelSlicer;
using Telemetry::Container;
using Telemetry::ContainerReader;
using Telemetry::ContainerWriter;
using Telemetry::TimeWindow;

LapExtractor::LapExtractor(const ExtractOptions& options) : m_options(options) {
}

Container LapExtractor::extractLap(const Container& container, const std::vector<LapBoundary>& laps,
                                   const LapSelector& selector) const {
    const LapBoundary& lap = LapCalculator::select(laps, selector);
    return ChannelSlicer::slice(container, TimeWindow{lap.start_time, lap.end_time});
}

ExtractResult LapExtractor::extract(const std::string& ld_path, const std::string& ldx_path,
                                    const LapSelector& selector,
                                    const std::string& out_ld_path, const std::string& out_ldx_path) const {
    Debug::log("extract", "Extracting ", selector.describe(), " from ", ld_path);

    MarkerOptions marker_options;
    marker_options.unit = m_options.marker_unit;

    std::vector<Laps::Marker> markers = MarkerParser::parseFile(ldx_path, marker_options);
    std::vector<LapBoundary> laps = LapCalculator::computeLaps(markers);
    LapBoundary lap = LapCalculator::select(laps, selector);

    Container source = ContainerReader::readFile(ld_path);
    Container sliced = ChannelSlicer::slice(source, TimeWindow{lap.start_time, lap.end_time});

    std::vector<uint8_t> ld_bytes = ContainerWriter::write(sliced);
    std::string ldx_text = MarkerWriter::write(lap.duration, marker_options);

    size_t ld_size = ld_bytes.size();
    IO::writeFilesTogether({
        IO::FileContents{out_ld_path, std::move(ld_bytes)},
        IO::FileContents{out_ldx_path, std::vector<uint8_t>(ldx_text.begin(), ldx_text.end())}
    });

    Debug::log("extract", "Wrote lap ", lap.lap_index, " (", Laps::formatLapTime(lap.duration), ") to ",
               out_ld_path, " and ", out_ldx_path);

    ExtractResult result;
    result.lap = lap;
    result.ld_path = out_ld_path;
    result.ldx_path = out_ldx_path;
    result.channel_count = sliced.channelCount();
    result.ld_bytes = ld_size;
    return result;
}

Inspection LapExtractor::inspect(const std::string& ld_path, const std::string& ldx_path) const {
    MarkerOptions marker_options;
    marker_options.unit = m_options.marker_unit;

    std::vector<Laps::Marker> markers = MarkerParser::parseFile(ldx_path, marker_options);
    std::vector<LapBoundary> laps = LapCalculator::computeLaps(markers);

    return Inspection{ContainerReader::readFile(ld_path), std::move(markers), std::move(laps)};
}

} // namespace Extract
} // namespace LapCut
