/*
 * test_marker_parser.cpp - Unit tests for MarkerParser
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "telemetry_test_fixtures.h"

using namespace LapCut::Core;
using namespace LapCut::Laps;
using namespace TestFramework;

namespace {

std::string wrapMarkers(const std::string& markers) {
    return "<LDXFile><Layers><Layer><MarkerBlock><MarkerGroup Name=\"Beacons\" Index=\"3\">" + markers +
           "</MarkerGroup></MarkerBlock></Layer></Layers></LDXFile>";
}

} // namespace

// ============================================================================
// Well-formed input
// ============================================================================

class MarkerParseTest : public TestCase {
public:
    MarkerParseTest() : TestCase("MarkerParser::parse") {}

protected:
    void runTest() override {
        std::vector<Marker> markers = MarkerParser::parse(makeMarkerXml({0.0, 10.0, 22.5}));
        ASSERT_EQUALS(3u, markers.size(), "Three markers");
        ASSERT_EQUALS(0.0, markers[0].time, "First marker");
        ASSERT_EQUALS(10.0, markers[1].time, "Second marker");
        ASSERT_EQUALS(22.5, markers[2].time, "Third marker");
        ASSERT_EQUALS("Manual.2", markers[1].name, "Marker name kept");

        // Whitespace inside the attribute value is tolerated
        markers = MarkerParser::parse(wrapMarkers("<Marker Time=\" 1.5 \"/><Marker Time=\"3\"/>"));
        ASSERT_EQUALS(1.5, markers[0].time, "Padded number");
        ASSERT_TRUE(markers[0].name.empty(), "Missing Name is empty");

        // Companion files saved with a UTF-8 byte order mark
        markers = MarkerParser::parse("\xEF\xBB\xBF" + makeMarkerXml({0.0, 10.0, 22.5}));
        ASSERT_EQUALS(3u, markers.size(), "Byte order mark skipped");
        ASSERT_EQUALS(22.5, markers[2].time, "Times intact after byte order mark");
    }
};

class MarkerUnitTest : public TestCase {
public:
    MarkerUnitTest() : TestCase("MarkerParser time units") {}

protected:
    void runTest() override {
        MarkerOptions micro;
        micro.unit = TimeUnit::MICROSECONDS;

        std::vector<Marker> markers = MarkerParser::parse(
            wrapMarkers("<Marker Time=\"0\"/><Marker Time=\"93367000\"/><Marker Time=\"187500000\"/>"), micro);
        ASSERT_EQUALS(3u, markers.size(), "Three markers");
        ASSERT_EQUALS(93.367, markers[1].time, "Microseconds scaled to seconds");
        ASSERT_EQUALS(187.5, markers[2].time, "Second lap end");

        markers = MarkerParser::parse(makeMarkerXml({0.0, 12.25}, TimeUnit::MICROSECONDS), micro);
        ASSERT_EQUALS(12.25, markers[1].time, "Fixture microseconds round trip");

        // Same text read as seconds is a million times larger
        markers = MarkerParser::parse(wrapMarkers("<Marker Time=\"0\"/><Marker Time=\"2000000\"/>"));
        ASSERT_EQUALS(2000000.0, markers[1].time, "Seconds is the default unit");
    }
};

class MarkerLegacyLayoutTest : public TestCase {
public:
    MarkerLegacyLayoutTest() : TestCase("MarkerParser legacy Markers element") {}

protected:
    void runTest() override {
        std::vector<Marker> markers = MarkerParser::parse(makeMarkerXml({0.0, 30.0, 61.5}, TimeUnit::SECONDS, true));
        ASSERT_EQUALS(3u, markers.size(), "Markers found under Markers element");
        ASSERT_EQUALS(61.5, markers[2].time, "Last marker");
    }
};

class MarkerSkipTest : public TestCase {
public:
    MarkerSkipTest() : TestCase("MarkerParser skips markers without Time") {}

protected:
    void runTest() override {
        std::vector<Marker> markers = MarkerParser::parse(
            wrapMarkers("<Marker Name=\"a\" Time=\"1\"/><Marker Name=\"note\"/><Marker Name=\"b\" Time=\"4\"/>"));
        ASSERT_EQUALS(2u, markers.size(), "Marker without Time ignored");
        ASSERT_EQUALS("b", markers[1].name, "Remaining markers in order");

        // Details and other elements never count as markers
        std::string xml = makeMarkerXml({0.0, 5.0});
        ASSERT_EQUALS(2u, MarkerParser::parse(xml).size(), "Only Marker elements count");
    }
};

// ============================================================================
// Malformed input
// ============================================================================

class MarkerMalformedTest : public TestCase {
public:
    MarkerMalformedTest() : TestCase("MarkerParser MalformedMarkerFile") {}

protected:
    void runTest() override {
        TelemetryException e = assertTelemetryError(TelemetryError::MALFORMED_MARKER_FILE,
            []() { MarkerParser::parse(makeMarkerXml({5.0, 3.0})); }, "Decreasing times");
        ASSERT_TRUE(std::string(e.what()).find("marker 1") != std::string::npos, "Names the offending marker");

        assertTelemetryError(TelemetryError::MALFORMED_MARKER_FILE,
            []() { MarkerParser::parse(makeMarkerXml({5.0, 5.0})); }, "Equal times");

        assertTelemetryError(TelemetryError::MALFORMED_MARKER_FILE,
            []() { MarkerParser::parse("<LDXFile><Layers>"); }, "Unclosed XML");

        assertTelemetryError(TelemetryError::MALFORMED_MARKER_FILE,
            []() { MarkerParser::parse("not xml at all"); }, "Not XML");

        e = assertTelemetryError(TelemetryError::MALFORMED_MARKER_FILE,
            []() { MarkerParser::parse(wrapMarkers("<Marker Time=\"0\"/><Marker Time=\"abc\"/>")); },
            "Non-numeric time");
        ASSERT_EQUALS("\"abc\"", e.getActual(), "Offending text reported");

        assertTelemetryError(TelemetryError::MALFORMED_MARKER_FILE,
            []() { MarkerParser::parse(wrapMarkers("<Marker Time=\"0\"/><Marker Time=\"12s\"/>")); },
            "Trailing garbage");

        assertTelemetryError(TelemetryError::MALFORMED_MARKER_FILE,
            []() { MarkerParser::parse(wrapMarkers("<Marker Time=\"-1\"/><Marker Time=\"2\"/>")); },
            "Negative time");

        assertTelemetryError(TelemetryError::MALFORMED_MARKER_FILE,
            []() { MarkerParser::parse(wrapMarkers("<Marker Time=\"0\"/><Marker Time=\"inf\"/>")); },
            "Infinite time");

        assertTelemetryError(TelemetryError::MALFORMED_MARKER_FILE,
            []() { MarkerParser::parse(wrapMarkers("<Marker Time=\"0\"/><Marker Time=\"\"/>")); },
            "Empty time");
    }
};

class MarkerEmptySetTest : public TestCase {
public:
    MarkerEmptySetTest() : TestCase("MarkerParser EmptyMarkerSet") {}

protected:
    void runTest() override {
        assertTelemetryError(TelemetryError::EMPTY_MARKER_SET,
            []() { MarkerParser::parse(makeMarkerXml({12.0})); }, "One marker");
        assertTelemetryError(TelemetryError::EMPTY_MARKER_SET,
            []() { MarkerParser::parse(makeMarkerXml({})); }, "No markers");
        assertTelemetryError(TelemetryError::EMPTY_MARKER_SET,
            []() { MarkerParser::parse("<LDXFile/>"); }, "No MarkerBlock");
    }
};

class MarkerFileTest : public TestCase {
public:
    MarkerFileTest() : TestCase("MarkerParser::parseFile") {}

protected:
    void runTest() override {
        TempDir dir;
        std::string path = dir.file("session.ldx");
        LapCut::IO::writeFileAtomically(path, makeMarkerXml({0.0, 40.0, 81.0}));

        ASSERT_EQUALS(3u, MarkerParser::parseFile(path).size(), "Read from disk");

        TestPatterns::assertThrows<IOException>([&]() {
            MarkerParser::parseFile(dir.file("absent.ldx"));
        }, "", "Missing file is an IOException");
    }
};

class TimeUnitTest : public TestCase {
public:
    TimeUnitTest() : TestCase("parseTimeUnit") {}

protected:
    void runTest() override {
        ASSERT_TRUE(parseTimeUnit("s") == TimeUnit::SECONDS, "s");
        ASSERT_TRUE(parseTimeUnit("seconds") == TimeUnit::SECONDS, "seconds");
        ASSERT_TRUE(parseTimeUnit("us") == TimeUnit::MICROSECONDS, "us");
        ASSERT_TRUE(parseTimeUnit("usec") == TimeUnit::MICROSECONDS, "usec");
        ASSERT_EQUALS(std::string("microseconds"), std::string(timeUnitName(TimeUnit::MICROSECONDS)), "Name");
        ASSERT_EQUALS(1e6, timeUnitsPerSecond(TimeUnit::MICROSECONDS), "Units per second");

        TestPatterns::assertThrows<std::invalid_argument>([]() {
            parseTimeUnit("ms");
        }, "Unknown time unit", "Milliseconds are not supported");
    }
};

// ============================================================================
// Test Registration
// ============================================================================

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("MarkerParser Unit Tests");

    suite.addTest(std::make_unique<MarkerParseTest>());
    suite.addTest(std::make_unique<MarkerUnitTest>());
    suite.addTest(std::make_unique<MarkerLegacyLayoutTest>());
    suite.addTest(std::make_unique<MarkerSkipTest>());
    suite.addTest(std::make_unique<MarkerMalformedTest>());
    suite.addTest(std::make_unique<MarkerEmptySetTest>());
    suite.addTest(std::make_unique<MarkerFileTest>());
    suite.addTest(std::make_unique<TimeUnitTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
