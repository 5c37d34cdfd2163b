// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 *//*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "lab.h"

#include <cmath>

namespace Chromapick::Colors {

static double lab_f(double t)
{
    if (t > 0.008856) {
        return std::cbrt(t);
    }
    return 7.787 * t + 16.0 / 116.0;
}

/**
 * Convert a color from the XYZ colorspace to CIE 1976 L*a*b* relative to
 * the D65 white.
 */
LABColor xyz_to_lab(XYZColor const &xyz)
{
    double fx = lab_f(xyz.x / LAB_WHITE.x);
    double fy = lab_f(xyz.y / LAB_WHITE.y);
    double fz = lab_f(xyz.z / LAB_WHITE.z);

    return {
        116 * fy - 16,
        500 * (fx - fy),
        200 * (fy - fz),
    };
}

} // namespace Chromapick::Colors
