// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 *//*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "xyy.h"

namespace Chromapick::Colors {

/**
 * Project the tristimulus values onto the chromaticity plane, keeping Y
 * as the luminance. Black has no chromaticity and gives all zeros.
 */
xyColor xyz_to_xyy(XYZColor const &xyz)
{
    double sum = xyz.x + xyz.y + xyz.z;
    if (sum == 0) {
        return {0, 0, 0};
    }
    return {xyz.x / sum, xyz.y / sum, xyz.y};
}

/**
 * Convert chromaticity and luminance back into tristimulus values.
 * A chromaticity with y = 0 gives all zeros.
 */
XYZColor xyy_to_xyz(xyColor const &xyy)
{
    if (xyy.y == 0) {
        return {0, 0, 0};
    }
    return {
        xyy.x * xyy.Y / xyy.y,
        xyy.Y,
        (1 - xyy.x - xyy.y) * xyy.Y / xyy.y,
    };
}

} // namespace Chromapick::Colors
