// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "color-info.h"

#include "colors/formats.h"
#include "colors/gamut.h"
#include "colors/spaces/hsl.h"
#include "colors/spaces/lab.h"
#include "colors/spaces/linear-rgb.h"
#include "colors/spaces/oklch.h"
#include "colors/spaces/xyy.h"
#include "colors/spaces/xyz.h"
#include "colors/temperature.h"

namespace Chromapick::Colors {

/**
 * Derive every representation of a display color.
 *
 * @arg rgb - The display color on the 0..255 scale, it is linearized before
 *            the matrix conversion into XYZ.
 * @arg space - The space the rgb channels are expressed in.
 */
ColorInfo describe(RGBColor const &rgb, Space::Type space)
{
    ColorInfo info;
    info.rgb = rgb;
    info.space = space;
    info.xyz = rgb_to_xyz(display_to_linear(rgb), space);
    info.xy = xyz_to_xyy(info.xyz);
    info.hsl = rgb_to_hsl(rgb);
    info.lab = xyz_to_lab(info.xyz);
    info.oklch = lab_to_oklch(info.lab);
    info.css = css_color(rgb, space);
    info.temperature = color_temperature(info.xy.x, info.xy.y);
    info.in_gamut = is_in_gamut(rgb);
    return info;
}

} // namespace Chromapick::Colors
