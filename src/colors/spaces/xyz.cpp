// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 *//*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "xyz.h"

#include "colors/manager.h"
#include "definition.h"

namespace Chromapick::Colors {

/**
 * Convert linear RGB into CIE XYZ using the matrix of the given space.
 *
 * The channels are taken as they are, no gamma is removed and no range is
 * enforced. Reserved spaces use the sRGB matrix.
 */
XYZColor rgb_to_xyz(RGBColor const &rgb, Space::Type space)
{
    auto out = Space::multiply(Manager::get().find(space).getToXYZ(), {rgb.r, rgb.g, rgb.b});
    return {out[0], out[1], out[2]};
}

/**
 * Convert CIE XYZ into linear RGB in the given space. The result may fall
 * outside of 0..1 when the color is not inside the space's gamut.
 */
RGBColor xyz_to_rgb(XYZColor const &xyz, Space::Type space)
{
    auto out = Space::multiply(Manager::get().find(space).getFromXYZ(), {xyz.x, xyz.y, xyz.z});
    return {out[0], out[1], out[2]};
}

} // namespace Chromapick::Colors
