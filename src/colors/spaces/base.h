// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SEEN_COLORS_SPACES_BASE_H
#define SEEN_COLORS_SPACES_BASE_H

#include <array>
#include <2geom/point.h>

constexpr double SCALE_UP(double v, double a, double b)
{
    return (v * (b - a)) + a;
}
constexpr double SCALE_DOWN(double v, double a, double b)
{
    return (v - a) / (b - a);
}

namespace Chromapick::Colors::Space {

/** A 3x3 matrix stored row by row. */
using Matrix = std::array<std::array<double, 3>, 3>;
using Vector3 = std::array<double, 3>;

/** A closed polygon in chromaticity space, the last point repeats the first. */
using Polygon = std::array<Geom::Point, 4>;

/** Compute the dot-product between two 3D-vectors. */
template <typename A1, typename A2>
inline constexpr double dot3(const A1 &a1, const A2 &a2)
{
    return a1[0] * a2[0] + a1[1] * a2[1] + a1[2] * a2[2];
}

/** Multiply a column vector by the matrix. */
inline Vector3 multiply(Matrix const &m, Vector3 const &v)
{
    return {dot3(m[0], v), dot3(m[1], v), dot3(m[2], v)};
}

} // namespace Chromapick::Colors::Space

#endif // SEEN_COLORS_SPACES_BASE_H
