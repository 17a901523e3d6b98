/*
 * MarkerWriter.cpp - Emit a single-lap .ldx document
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "lapcut.h"

namespace LapCut {
namespace Laps {

using Core::TelemetryError;
using Core::TelemetryException;
using Core::Utility::XMLUtil;

namespace {

XMLUtil::Element beacon(size_t ordinal, double time, TimeUnit unit) {
    XMLUtil::Element marker("Marker");
    marker.setAttribute("Version", "100")
          .setAttribute("ClassName", "BCN")
          .setAttribute("Name", "Manual." + std::to_string(ordinal))
          .setAttribute("Flags", "77")
          .setAttribute("Time", MarkerWriter::formatNumber(time * timeUnitsPerSecond(unit)));
    return marker;
}

XMLUtil::Element detail(const std::string& id, const std::string& value) {
    XMLUtil::Element element("String");
    element.setAttribute("Id", id).setAttribute("Value", value);
    return element;
}

} // namespace

std::string MarkerWriter::formatNumber(double value) {
    for (int precision = 15; precision <= std::numeric_limits<double>::max_digits10; ++precision) {
        std::ostringstream oss;
        oss.imbue(std::locale::classic());
        oss << std::setprecision(precision) << value;
        if (std::strtod(oss.str().c_str(), nullptr) == value) {
            return oss.str();
        }
    }
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return oss.str();
}

std::string MarkerWriter::write(double duration, const MarkerOptions& options) {
    if (!std::isfinite(duration) || duration <= 0.0) {
        throw TelemetryException(TelemetryError::INVALID_WINDOW, "lap duration must be positive")
            .expected("> 0").actual(duration);
    }

    XMLUtil::Element root("LDXFile");
    root.setAttribute("Locale", "English_United Kingdom.1252")
        .setAttribute("DefaultLocale", "C")
        .setAttribute("Version", "1.6");

    XMLUtil::Element& layers = root.addChild(XMLUtil::Element("Layers"));
    XMLUtil::Element& layer = layers.addChild(XMLUtil::Element("Layer"));
    XMLUtil::Element& block = layer.addChild(XMLUtil::Element("MarkerBlock"));
    XMLUtil::Element& group = block.addChild(XMLUtil::Element("MarkerGroup"));
    group.setAttribute("Name", "Beacons").setAttribute("Index", "3");
    group.addChild(beacon(1, 0.0, options.unit));
    group.addChild(beacon(2, duration, options.unit));
    layer.addChild(XMLUtil::Element("RangeBlock"));

    XMLUtil::Element& details = layers.addChild(XMLUtil::Element("Details"));
    details.addChild(detail("Total Laps", "1"));
    details.addChild(detail("Fastest Time", formatLapTime(duration)));
    details.addChild(detail("Fastest Lap", "1"));

    Debug::log("ldx", "Writing single lap of ", formatLapTime(duration), " (", timeUnitName(options.unit), ")");
    return XMLUtil::generateDocument(root);
}

void MarkerWriter::writeFile(const std::string& path, double duration, const MarkerOptions& options) {
    IO::writeFileAtomically(path, write(duration, options));
}

} // namespace Laps
} // namespace LapCut
