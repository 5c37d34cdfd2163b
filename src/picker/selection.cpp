// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "selection.h"

#include <algorithm>

#include "colors/gamut.h"
#include "colors/spaces/base.h"
#include "colors/spaces/linear-rgb.h"
#include "colors/spaces/xyy.h"
#include "colors/spaces/xyz.h"
#include "colors/temperature.h"
#include "diagram-geometry.h"

namespace Chromapick::Picker {

using namespace Colors;

/**
 * Turn a point of the diagram into a display color of the given space.
 *
 * The gamut signal looks at the encoded color before it is clamped into
 * 0..255, the returned color is the clamped one.
 */
PickResult pick(xyColor const &xyy, Space::Type space)
{
    auto linear = xyz_to_rgb(xyy_to_xyz(xyy), space);
    auto encode = [](double c) { return SCALE_UP(gamma_correct(c), 0, RGB_SCALE); };
    auto encoded = RGBColor{encode(linear.r), encode(linear.g), encode(linear.b)};

    return {linear_to_display(linear), is_in_gamut(encoded)};
}

Selection::Selection(RGBColor const &rgb, xyColor const &xy, Space::Type space, double luminance, bool in_gamut)
    : _xy(xy)
    , _luminance(luminance)
    , _in_gamut(in_gamut)
    , _info(describe(rgb, space))
{}

Selection Selection::from_rgb(RGBColor const &rgb, Space::Type space, double luminance)
{
    auto info = describe(rgb, space);
    return Selection(rgb, info.xy, space, std::clamp(luminance, 0.0, 1.0), info.in_gamut);
}

Selection Selection::with_chromaticity(double x, double y) const
{
    auto xyy = xyColor{std::clamp(x, 0.0, 1.0), std::clamp(y, 0.0, 1.0), _luminance};
    auto result = pick(xyy, space());
    return Selection(result.rgb, xyy, space(), _luminance, result.in_gamut);
}

Selection Selection::with_canvas_point(Geom::Point const &pixel, DiagramGeometry const &geometry) const
{
    auto xy = geometry.to_chromaticity(pixel);
    return with_chromaticity(xy.x(), xy.y());
}

Selection Selection::with_rgb(RGBColor const &rgb) const
{
    return from_rgb(rgb, space(), _luminance);
}

// The color is kept as it is, only its description changes
Selection Selection::with_space(Space::Type space) const
{
    return Selection(rgb(), _xy, space, _luminance, _in_gamut);
}

// Applies to the next pick, the current color is kept
Selection Selection::with_luminance(double luminance) const
{
    return Selection(rgb(), _xy, space(), std::clamp(luminance, 0.0, 1.0), _in_gamut);
}

double Selection::temperature() const
{
    return color_temperature(_xy.x, _xy.y);
}

} // namespace Chromapick::Picker
