// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "gamut.h"

#include "colors/manager.h"
#include "colors/spaces/definition.h"

namespace Chromapick::Colors {

namespace {

constexpr double RGB_MAX = 255.0;

bool _in_range(double value)
{
    return value >= 0 && value <= RGB_MAX;
}

} // namespace

bool is_in_gamut(RGBColor const &rgb)
{
    return _in_range(rgb.r) && _in_range(rgb.g) && _in_range(rgb.b);
}

/**
 * Test the chromaticity against the triangle of the space's primaries.
 * Points on an edge or a corner count as inside. Reserved spaces use the
 * sRGB triangle.
 */
bool chromaticity_in_gamut(Geom::Point const &xy, Space::Type space)
{
    auto const &polygon = Manager::get().find(space).getGamut();

    bool negative = false;
    bool positive = false;
    for (unsigned i = 0; i + 1 < polygon.size(); i++) {
        auto side = Geom::cross(polygon[i + 1] - polygon[i], xy - polygon[i]);
        negative |= side < 0;
        positive |= side > 0;
    }
    // Inside means the point is on the same side of every edge, whatever the winding
    return !(negative && positive);
}

} // namespace Chromapick::Colors
