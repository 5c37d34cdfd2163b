// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 *//*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "oklch.h"

#include <2geom/angle.h>
#include <2geom/point.h>
#include <2geom/ray.h>

namespace Chromapick::Colors {

constexpr double LCH_SCALE = 100;

OKLCHColor lab_to_oklch(LABColor const &lab)
{
    auto ab = Geom::Point(lab.a, lab.b);
    double h;
    double const c = ab.length();

    /* Grays: disambiguate hue */
    if (c < 0.00000001) {
        h = 0;
    } else {
        h = Geom::deg_from_rad(Geom::atan2(ab));
        if (h < 0.0) {
            h += 360.0;
        }
    }
    return {lab.l / LCH_SCALE, c / LCH_SCALE, h};
}

} // namespace Chromapick::Colors
