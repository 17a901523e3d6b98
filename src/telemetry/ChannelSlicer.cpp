/*
 * ChannelSlicer.cpp - Cut every channel of a Container to a time window
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "lapcut.h"

namespace LapCut {
namespace Telemetry {

using Core::TelemetryError;
using Core::TelemetryException;

namespace {

constexpr double INDEX_SNAP_TOLERANCE = 1e-9;

} // namespace

size_t ChannelSlicer::sampleIndex(double time, uint16_t frequency, size_t sample_count) {
    double scaled = time * static_cast<double>(frequency);
    double nearest = std::round(scaled);
    if (std::fabs(scaled - nearest) <= INDEX_SNAP_TOLERANCE * std::max(1.0, std::fabs(scaled))) {
        scaled = nearest;
    }

    double index = std::floor(scaled);
    if (index <= 0.0) {
        return 0;
    }
    if (index >= static_cast<double>(sample_count)) {
        return sample_count;
    }
    return static_cast<size_t>(index);
}

SampleRange ChannelSlicer::sampleRange(const TimeWindow& window, uint16_t frequency, size_t sample_count) {
    size_t begin = sampleIndex(window.start, frequency, sample_count);
    size_t end = sampleIndex(window.end, frequency, sample_count);
    return {begin, std::max(begin, end)};
}

Container ChannelSlicer::slice(const Container& source, const TimeWindow& window) {
    if (!std::isfinite(window.start) || !std::isfinite(window.end) || window.end <= window.start) {
        throw TelemetryException(TelemetryError::INVALID_WINDOW, "slice window is empty or not finite")
            .expected("start < end")
            .actual("[" + std::to_string(window.start) + ", " + std::to_string(window.end) + ")");
    }

    Debug::log("slice", "Slicing ", source.channelCount(), " channels to [", window.start, ", ",
               window.end, ")");

    std::vector<Channel> channels;
    channels.reserve(source.channelCount());
    for (const auto& channel : source.channels()) {
        SampleRange range = sampleRange(window, channel.frequency(), channel.sampleCount());
        ChannelBuffer buffer = channel.buffer().slice(range.begin, range.end);

        DEBUG_LOG_LAZY("slice", "'", channel.name(), "' @ ", channel.frequency(), " Hz: [",
                       range.begin, ", ", range.end, ") of ", channel.sampleCount());

        channels.emplace_back(channel.descriptor(), std::move(buffer));
    }

    Header header = source.header();
    header.setChannelCount(static_cast<uint32_t>(channels.size()));

    return Container(std::move(header), std::move(channels), source.preamble(),
                     source.catalogPadding(), source.trailer());
}

} // namespace Telemetry
} // namespace LapCut
