// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Gamut boundaries in CIE 1931 chromaticity space.
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SEEN_COLORS_GAMUT_H
#define SEEN_COLORS_GAMUT_H

#include <2geom/point.h>

#include "colors/color.h"
#include "colors/spaces/base.h"
#include "colors/spaces/enum.h"

namespace Chromapick::Colors {

constexpr xyColor D65_WHITE_POINT = {0.3127, 0.3290, 1.0};

// Simplified spectral locus, a triangle through the red, green and violet extremes
inline Space::Polygon const CHROMATICITY_BOUNDARY = {
    Geom::Point(0.7347, 0.2653), Geom::Point(0.2738, 0.7174), Geom::Point(0.1666, 0.0089),
    Geom::Point(0.7347, 0.2653)};

inline Space::Polygon const SRGB_GAMUT = {
    Geom::Point(0.64, 0.33), Geom::Point(0.30, 0.60), Geom::Point(0.15, 0.06), Geom::Point(0.64, 0.33)};

inline Space::Polygon const P3_GAMUT = {
    Geom::Point(0.68, 0.32), Geom::Point(0.265, 0.69), Geom::Point(0.15, 0.06), Geom::Point(0.68, 0.32)};

inline Space::Polygon const REC2020_GAMUT = {
    Geom::Point(0.708, 0.292), Geom::Point(0.170, 0.797), Geom::Point(0.131, 0.046), Geom::Point(0.708, 0.292)};

// Check that every channel of a display color lies within 0..255
bool is_in_gamut(RGBColor const &rgb);

// Check if the chromaticity lies inside or on the edge of the space's primaries triangle
bool chromaticity_in_gamut(Geom::Point const &xy, Space::Type space = Space::Type::RGB);

} // namespace Chromapick::Colors

#endif // SEEN_COLORS_GAMUT_H
