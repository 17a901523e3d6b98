/*
 * lapcut.h - main include for all other source files.
 * This file is part of LapCut.
 * Copyright © 2025-2026 Kirn Gill <segin2005@gmail.com>
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

#ifndef __LAPCUT_H__
#define __LAPCUT_H__

// defines
#define LAPCUT_VERSION "1-CURRENT"
#define LAPCUT_MAINTAINER "Kirn Gill II <segin2005@gmail.com>"

//
// C++ Standard Library
#include <algorithm>
#include <array>
#include <exception>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <locale>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <string>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>
#include <chrono>

// C Standard Library (wrapped)
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

// System-specific headers
#include <sys/stat.h>
#include <sys/types.h>
#ifndef _WIN32
#include <unistd.h>
#endif

// Local project headers (in dependency order)
#include "debug.h"
#include "exceptions.h"

// Core utilities
#include "core/utility/ByteOrder.h"
#include "core/utility/XMLUtil.h"

// I/O
#include "io/RAIIFileHandle.h"
#include "io/FileIO.h"

// Telemetry container (.ld)
#include "telemetry/LDFormat.h"
#include "telemetry/Header.h"
#include "telemetry/Channel.h"
#include "telemetry/Container.h"
#include "telemetry/ContainerReader.h"
#include "telemetry/ContainerWriter.h"
#include "telemetry/ChannelSlicer.h"

// Lap markers (.ldx)
#include "laps/Marker.h"
#include "laps/MarkerParser.h"
#include "laps/MarkerWriter.h"
#include "laps/LapCalculator.h"

// Extraction pipeline
#include "extract/LapExtractor.h"

#endif // __LAPCUT_H__
