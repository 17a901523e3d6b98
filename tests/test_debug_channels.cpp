/*
 * test_debug_channels.cpp - Tests for the channel-based debug logger
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "telemetry_test_fixtures.h"

using namespace LapCut;
using namespace TestFramework;

// Each test leaves the logger shut down so the next one starts clean.
class DebugTestCase : public TestCase {
public:
    explicit DebugTestCase(const std::string& name) : TestCase(name) {}

protected:
    void setUp() override { Debug::shutdown(); }
    void tearDown() override { Debug::shutdown(); }
};

class ParseChannelListTest : public TestCase {
public:
    ParseChannelListTest() : TestCase("Debug::parseChannelList") {}

protected:
    void runTest() override {
        auto channels = Debug::parseChannelList("ld, ldx ,,slice");
        ASSERT_EQUALS(3u, channels.size(), "Empty items dropped");
        ASSERT_EQUALS("ld", channels[0], "First channel");
        ASSERT_EQUALS("ldx", channels[1], "Whitespace trimmed");
        ASSERT_EQUALS("slice", channels[2], "Last channel");

        ASSERT_TRUE(Debug::parseChannelList("").empty(), "Empty list");
        ASSERT_EQUALS(1u, Debug::parseChannelList("all").size(), "Single item");
    }
};

class KnownChannelTest : public TestCase {
public:
    KnownChannelTest() : TestCase("Debug::isKnownChannel") {}

protected:
    void runTest() override {
        for (const auto& channel : Debug::knownChannels()) {
            ASSERT_TRUE(Debug::isKnownChannel(channel), "Listed channel is known: " + channel);
        }
        ASSERT_TRUE(Debug::isKnownChannel("all"), "all is accepted");
        ASSERT_FALSE(Debug::isKnownChannel("audio"), "Unrelated name rejected");
        ASSERT_FALSE(Debug::isKnownChannel("LD"), "Names are case sensitive");
    }
};

class ChannelEnableTest : public DebugTestCase {
public:
    ChannelEnableTest() : DebugTestCase("Debug channel enabling") {}

protected:
    void runTest() override {
        ASSERT_FALSE(Debug::isChannelEnabled("ld"), "Nothing enabled before init");

        Debug::init("", {"ld"});
        ASSERT_TRUE(Debug::isChannelEnabled("ld"), "ld enabled");
        ASSERT_FALSE(Debug::isChannelEnabled("ldx"), "ldx still disabled");

        Debug::init("", {"ldx"});
        ASSERT_TRUE(Debug::isChannelEnabled("ld"), "Channels accumulate");
        ASSERT_TRUE(Debug::isChannelEnabled("ldx"), "ldx enabled");

        Debug::shutdown();
        ASSERT_FALSE(Debug::isChannelEnabled("ld"), "shutdown clears channels");

        Debug::init("", {"all"});
        ASSERT_TRUE(Debug::isChannelEnabled("extract"), "all enables every channel");
    }
};

class LogFileTest : public DebugTestCase {
public:
    LogFileTest() : DebugTestCase("Debug log file output") {}

protected:
    void runTest() override {
        TempDir dir;
        std::string path = dir.file("lapcut.log");

        Debug::init(path, {"laps"});
        Debug::log("laps", "lap ", 3, " of ", 7);
        Debug::log("ld", "not written");
        DEBUG_LOG_LAZY("laps", "lazy ", 1.5);
        Debug::shutdown();

        std::string text = IO::readTextFile(path);
        ASSERT_TRUE(text.find("[laps]: lap 3 of 7\n") != std::string::npos, "Formatted message written");
        ASSERT_TRUE(text.find("[laps]: lazy 1.5\n") != std::string::npos, "Lazy message written");
        ASSERT_TRUE(text.find("not written") == std::string::npos, "Disabled channel dropped");

        // HH:MM:SS.uuuuuu prefix
        ASSERT_TRUE(text.size() > 16, "Line has a timestamp");
        ASSERT_EQUALS(':', text[2], "Hour separator");
        ASSERT_EQUALS(':', text[5], "Minute separator");
        ASSERT_EQUALS('.', text[8], "Fraction separator");
        ASSERT_EQUALS(' ', text[15], "Timestamp ends after six digits");

        // Reopening appends rather than truncating
        Debug::init(path, {"laps"});
        Debug::log("laps", "second run");
        Debug::shutdown();
        std::string appended = IO::readTextFile(path);
        ASSERT_TRUE(appended.find("lap 3 of 7") != std::string::npos, "Earlier output kept");
        ASSERT_TRUE(appended.find("second run") != std::string::npos, "New output appended");
    }
};

class LazyArgumentsTest : public DebugTestCase {
public:
    LazyArgumentsTest() : DebugTestCase("DEBUG_LOG_LAZY skips disabled channels") {}

protected:
    void runTest() override {
        int evaluated = 0;
        auto expensive = [&evaluated]() { ++evaluated; return std::string("x"); };

        DEBUG_LOG_LAZY("slice", expensive());
        ASSERT_EQUALS(0, evaluated, "Arguments not evaluated while disabled");

        TempDir dir;
        Debug::init(dir.file("slice.log"), {"slice"});
        DEBUG_LOG_LAZY("slice", expensive());
        ASSERT_EQUALS(1, evaluated, "Arguments evaluated once enabled");
    }
};

// ============================================================================
// Test Registration
// ============================================================================

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("Debug Channel Tests");

    suite.addTest(std::make_unique<ParseChannelListTest>());
    suite.addTest(std::make_unique<KnownChannelTest>());
    suite.addTest(std::make_unique<ChannelEnableTest>());
    suite.addTest(std::make_unique<LogFileTest>());
    suite.addTest(std::make_unique<LazyArgumentsTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
