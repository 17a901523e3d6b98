/*
 * main.cpp - contains main(), mostly.
 * This file is part of LapCut.
 * Copyright © 2011-2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#include "lapcut.h"
#include <getopt.h>

using namespace LapCut;

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_FAILED = 2;

struct LapCutOptions {
    std::string input;
    std::string companion;
    std::string output;
    bool fastest = false;
    bool have_lap = false;
    size_t lap = 0;
    bool info = false;
    Laps::TimeUnit unit = Laps::TimeUnit::SECONDS;
    std::string debug_channels;
    std::string logfile;
};

void about_console() {
    std::cout << "LapCut version " << LAPCUT_VERSION << std::endl
              << "Cuts single laps out of MoTeC .ld/.ldx telemetry logs." << std::endl
              << "Maintainer: " << LAPCUT_MAINTAINER << std::endl;
}

void usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <file.ld>" << std::endl
              << "  -l, --lap N          extract lap N (0-based)" << std::endl
              << "  -F, --fastest        extract the fastest lap" << std::endl
              << "  -o, --output PATH    output .ld path (default <file>_lapN.ld)" << std::endl
              << "  -u, --units s|us     unit of .ldx marker times (default s)" << std::endl
              << "  -i, --info           list header, channels and laps only" << std::endl
              << "  -d, --debug LIST     enable debug channels (ld,ldx,laps,slice,extract,io or all)" << std::endl
              << "  -L, --logfile PATH   write debug output to PATH" << std::endl
              << "  -v, --version        print version and exit" << std::endl;
}

bool parseLapIndex(const char* text, size_t& lap) {
    char* end = nullptr;
    errno = 0;
    unsigned long long value = strtoull(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE || text[0] == '-') {
        return false;
    }
    lap = static_cast<size_t>(value);
    return true;
}

void printInfo(const Extract::Inspection& inspection) {
    const Telemetry::Header& header = inspection.container.header();
    Telemetry::SessionInfo session = inspection.container.sessionInfo();

    std::cout << "Device:   " << header.deviceType() << " v" << header.deviceVersion()
              << " (serial " << header.serial() << ")" << std::endl
              << "Recorded: " << header.date() << " " << header.time() << std::endl
              << "Driver:   " << header.driver() << std::endl
              << "Vehicle:  " << header.vehicleId() << std::endl
              << "Venue:    " << header.venue() << std::endl;
    if (!session.event_name.empty()) {
        std::cout << "Event:    " << session.event_name << " / " << session.session << std::endl;
    }

    std::cout << std::endl << inspection.container.channelCount() << " channels:" << std::endl;
    for (const auto& channel : inspection.container.channels()) {
        const auto& d = channel.descriptor();
        std::cout << "  " << std::left << std::setw(32) << d.name() << std::right
                  << std::setw(5) << d.frequency() << " Hz "
                  << std::setw(8) << channel.sampleCount() << " x "
                  << std::setw(7) << Telemetry::sampleTypeName(d.sampleType())
                  << "  " << d.unit() << std::endl;
    }

    std::cout << std::endl << inspection.laps.size() << " laps:" << std::endl;
    for (const auto& lap : inspection.laps) {
        std::cout << "  " << std::setw(3) << lap.lap_index << "  "
                  << std::setw(10) << Laps::formatLapTime(lap.duration)
                  << "  (" << lap.start_time << " - " << lap.end_time << " s)" << std::endl;
    }
}

int run(const LapCutOptions& options) {
    Extract::ExtractOptions extract_options;
    extract_options.marker_unit = options.unit;
    Extract::LapExtractor extractor(extract_options);

    if (options.info) {
        printInfo(extractor.inspect(options.input, options.companion));
        return 0;
    }

    Laps::LapSelector selector = options.fastest ? Laps::LapSelector::fastest()
                                                 : Laps::LapSelector::index(options.lap);

    std::string out_ld = options.output;
    if (out_ld.empty()) {
        std::string suffix = options.fastest ? "_fastest" : "_lap" + std::to_string(options.lap);
        out_ld = IO::replaceExtension(options.input, "") + suffix + ".ld";
    }
    std::string out_ldx = IO::replaceExtension(out_ld, ".ldx");

    Extract::ExtractResult result = extractor.extract(options.input, options.companion, selector,
                                                      out_ld, out_ldx);

    std::cout << "Lap " << result.lap.lap_index << " (" << Laps::formatLapTime(result.lap.duration)
              << ", " << result.channel_count << " channels) -> " << result.ld_path
              << ", " << result.ldx_path << std::endl;
    return 0;
}

} // namespace

int main(int argc, char *argv[]) {
    LapCutOptions options;

    static const struct option long_options[] = {
        {"lap", required_argument, 0, 'l'},
        {"fastest", no_argument, 0, 'F'},
        {"output", required_argument, 0, 'o'},
        {"units", required_argument, 0, 'u'},
        {"info", no_argument, 0, 'i'},
        {"debug", required_argument, 0, 'd'},
        {"logfile", required_argument, 0, 'L'},
        {"version", no_argument, 0, 'v'},
        {0, 0, 0, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "l:Fo:u:id:L:v", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'l':
                if (!parseLapIndex(optarg, options.lap)) {
                    std::cerr << argv[0] << ": invalid lap number '" << optarg << "'" << std::endl;
                    return EXIT_USAGE;
                }
                options.have_lap = true;
                break;
            case 'F':
                options.fastest = true;
                break;
            case 'o':
                options.output = optarg;
                break;
            case 'u':
                try {
                    options.unit = Laps::parseTimeUnit(optarg);
                } catch (const std::invalid_argument& e) {
                    std::cerr << argv[0] << ": " << e.what() << std::endl;
                    return EXIT_USAGE;
                }
                break;
            case 'i':
                options.info = true;
                break;
            case 'd':
                options.debug_channels = optarg;
                break;
            case 'L':
                options.logfile = optarg;
                break;
            case 'v':
                about_console();
                return 0;
            case '?': // Invalid option
                usage(argv[0]);
                return EXIT_USAGE; // getopt_long already prints an error message.
        }
    }

    if (optind + 1 != argc) {
        usage(argv[0]);
        return EXIT_USAGE;
    }
    options.input = argv[optind];
    options.companion = IO::replaceExtension(options.input, ".ldx");

    if (!options.info && options.fastest == options.have_lap) {
        std::cerr << argv[0] << ": choose exactly one of --lap N or --fastest" << std::endl;
        return EXIT_USAGE;
    }

    if (!options.debug_channels.empty() || !options.logfile.empty()) {
        std::vector<std::string> channels = Debug::parseChannelList(options.debug_channels);
        for (const auto& channel : channels) {
            if (!Debug::isKnownChannel(channel)) {
                std::cerr << argv[0] << ": warning: unknown debug channel '" << channel << "'" << std::endl;
            }
        }
        if (channels.empty()) {
            channels.push_back("all"); // --logfile alone logs everything
        }
        Debug::init(options.logfile, channels);
    }

    int status;
    try {
        status = run(options);
    } catch (const Core::TelemetryException& e) {
        std::cerr << argv[0] << ": " << e.what() << std::endl;
        status = EXIT_FAILED;
    } catch (const Core::IOException& e) {
        std::cerr << argv[0] << ": " << e.what() << std::endl;
        status = EXIT_FAILED;
    }

    Debug::shutdown();
    return status;
}
