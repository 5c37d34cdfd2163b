// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "report.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "colors/formats.h"
#include "selection.h"

namespace Chromapick::Picker {

using namespace Colors;

/**
 * Rounded Kelvin such as "6504K". Values the estimate can't express as a
 * number print as they are.
 */
std::string format_temperature(double kelvin)
{
    std::ostringstream oo;
    oo.imbue(std::locale("C"));
    if (std::isfinite(kelvin)) {
        oo << std::fixed << std::setprecision(0) << std::round(kelvin) << "K";
    } else {
        oo << kelvin;
    }
    return oo.str();
}

ReportLines report_lines(Selection const &selection)
{
    auto const &info = selection.info();

    std::ostringstream xy;
    xy.imbue(std::locale("C"));
    xy << std::fixed << std::setprecision(4) << "x: " << selection.chromaticity().x
       << ", y: " << selection.chromaticity().y;

    return {
        {"RGB", rgb_string(info.rgb)},
        {"HSL", hsl_string(info.hsl)},
        {"CSS", info.css},
        {"LAB", lab_string(info.lab)},
        {"OKLCH", oklch_string(info.oklch)},
        {"HEX", hex_string(info.rgb)},
        {"Chromaticity", xy.str()},
        {"Temperature", format_temperature(selection.temperature())},
        {"Gamut", selection.in_gamut() ? "In Gamut" : "Out of Gamut"},
    };
}

std::string format_report(Selection const &selection)
{
    auto lines = report_lines(selection);

    std::size_t width = 0;
    for (auto const &[label, value] : lines) {
        width = std::max(width, label.size());
    }

    std::ostringstream oo;
    for (auto const &[label, value] : lines) {
        oo << std::left << std::setw(width + 2) << (label + ":") << value << "\n";
    }
    return oo.str();
}

} // namespace Chromapick::Picker
