/*
 * telemetry_test_fixtures.h - Synthetic .ld/.ldx inputs for LapCut tests
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TELEMETRY_TEST_FIXTURES_H
#define TELEMETRY_TEST_FIXTURES_H

#include "lapcut.h"
#include "test_framework.h"

namespace TestFramework {

/**
 * @brief Catalog entry of a hand-assembled reference file
 */
struct ChannelSpec {
    std::string name;
    std::string short_name;
    std::string unit;
    uint16_t type_class;
    uint16_t width;
    uint16_t frequency;
    uint32_t count;
    int16_t shift;
    int16_t mul;
    int16_t scale;
    int16_t dec;
};

/**
 * @brief Five channels: float32 10 Hz, int16 100 Hz, int32 20 Hz,
 *        float16 50 Hz and an empty int16 5 Hz channel
 */
std::vector<ChannelSpec> referenceChannels();

/**
 * @brief Assemble an .ld image byte by byte, without ContainerWriter
 *
 * The image has an event/venue/vehicle preamble, records with non-zero
 * counters and opaque tails, patterned opaque header bytes, the given
 * amount of catalog padding and trailer, and sample values from
 * referenceValue().
 */
std::vector<uint8_t> buildReferenceFile(const std::vector<ChannelSpec>& channels,
                                        size_t padding = 0, size_t trailer = 0);

/**
 * @brief Stored value of sample i in a reference channel of the given type
 */
double referenceValue(LapCut::Telemetry::SampleType type, size_t i);

// Offsets within buildReferenceFile() output
size_t referencePreambleSize();
size_t referenceMetaPtr();

/**
 * @brief Container with one reference channel per spec, built through the API
 */
LapCut::Telemetry::Container makeContainer(const std::vector<ChannelSpec>& channels);

/**
 * @brief Channel of count samples holding referenceValue(type, i)
 */
LapCut::Telemetry::Channel makeReferenceChannel(const std::string& name, LapCut::Telemetry::SampleType type,
                                                uint16_t frequency, size_t count);

/**
 * @brief .ldx text with one Marker per time, times written in the given unit
 * @param legacy Put the markers under a Markers element instead of MarkerGroup
 */
std::string makeMarkerXml(const std::vector<double>& times_seconds,
                          LapCut::Laps::TimeUnit unit = LapCut::Laps::TimeUnit::SECONDS,
                          bool legacy = false);

/**
 * @brief Assert that test_func throws TelemetryException with the given code
 * @return The caught exception, for further checks on its context
 */
LapCut::Core::TelemetryException assertTelemetryError(LapCut::Core::TelemetryError expected,
                                                      std::function<void()> test_func,
                                                      const std::string& message);

/**
 * @brief Scratch directory under /tmp, removed with its files on destruction
 */
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return m_path; }
    std::string file(const std::string& name) const { return m_path + "/" + name; }

    /**
     * @brief Names of all entries currently in the directory
     */
    std::vector<std::string> list() const;

private:
    std::string m_path;
};

} // namespace TestFramework

#endif // TELEMETRY_TEST_FIXTURES_H
