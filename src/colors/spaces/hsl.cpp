// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 *//*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "hsl.h"

#include <algorithm>

#include "base.h"
#include "linear-rgb.h"

namespace Chromapick::Colors {

constexpr double HUE_SCALE = 360;
constexpr double SL_SCALE = 100;

/**
 * Convert a display color (0..255) into HSL with the hue in degrees and
 * saturation and lightness as percentages.
 */
HSLColor rgb_to_hsl(RGBColor const &rgb)
{
    double r = SCALE_DOWN(rgb.r, 0, RGB_SCALE);
    double g = SCALE_DOWN(rgb.g, 0, RGB_SCALE);
    double b = SCALE_DOWN(rgb.b, 0, RGB_SCALE);

    double max = std::max(std::max(r, g), b);
    double min = std::min(std::min(r, g), b);
    double delta = max - min;

    double h = 0;
    double s = 0;
    double l = (max + min) / 2.0;

    if (delta != 0) {
        if (l <= 0.5)
            s = delta / (max + min);
        else
            s = delta / (2 - max - min);

        if (r == max)
            h = (g - b) / delta;
        else if (g == max)
            h = 2.0 + (b - r) / delta;
        else
            h = 4.0 + (r - g) / delta;

        h = h / 6.0;

        if (h < 0)
            h += 1;
    }
    return {h * HUE_SCALE, s * SL_SCALE, l * SL_SCALE};
}

} // namespace Chromapick::Colors
