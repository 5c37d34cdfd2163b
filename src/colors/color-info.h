// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_COLORS_COLOR_INFO_H
#define SEEN_COLORS_COLOR_INFO_H

#include <string>

#include "colors/color.h"
#include "colors/spaces/enum.h"

namespace Chromapick::Colors {

/**
 * Everything the picker shows about one display color, derived in a single
 * pass so no value can go stale relative to another.
 */
struct ColorInfo
{
    RGBColor rgb;
    Space::Type space = Space::Type::RGB;
    XYZColor xyz;
    xyColor xy;
    HSLColor hsl;
    LABColor lab;
    OKLCHColor oklch;
    std::string css;
    double temperature = 0.0;
    bool in_gamut = true;
};

ColorInfo describe(RGBColor const &rgb, Space::Type space = Space::Type::RGB);

} // namespace Chromapick::Colors

#endif // SEEN_COLORS_COLOR_INFO_H
