// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for the chromaticity (xyY) conversions
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "colors/spaces/xyy.h"

#include <gtest/gtest.h>

#include "../test-utils.h"
#include "colors/gamut.h"

using namespace Chromapick::Colors;

namespace {

TEST(ColorsSpacesXYY, fromXYZ)
{
    EXPECT_TRUE(VectorIsNear(values(xyz_to_xyy({0.9505, 1.0, 1.089})), {0.312716, 0.329001, 1.0}, 1e-5));
    EXPECT_TRUE(VectorIsNear(values(xyz_to_xyy({1, 1, 1})), {1 / 3.0, 1 / 3.0, 1}, 1e-12));
}

TEST(ColorsSpacesXYY, toXYZ)
{
    auto xyz = xyy_to_xyz(D65_WHITE_POINT);
    EXPECT_TRUE(VectorIsNear(values(xyz), {0.950456, 1.0, 1.089058}, 1e-5));
}

TEST(ColorsSpacesXYY, roundTrip)
{
    for (unsigned i = 0; i < 200; i++) {
        auto v = random_values(3);
        if (v[0] + v[1] + v[2] <= 0 || v[1] == 0) {
            continue;
        }
        auto out = xyy_to_xyz(xyz_to_xyy({v[0], v[1], v[2]}));
        EXPECT_TRUE(VectorIsNear(values(out), v, 1e-6));
    }
}

TEST(ColorsSpacesXYY, degenerate)
{
    // Black has no chromaticity
    EXPECT_TRUE(VectorIsNear(values(xyz_to_xyy({0, 0, 0})), {0, 0, 0}, 1e-12));
    // Chromaticity y is a denominator
    EXPECT_TRUE(VectorIsNear(values(xyy_to_xyz({0.3, 0, 0.5})), {0, 0, 0}, 1e-12));
    // No luminance means no color whatever the chromaticity
    EXPECT_TRUE(VectorIsNear(values(xyy_to_xyz({0.3, 0.4, 0})), {0, 0, 0}, 1e-12));
}

} // namespace

/*
  Local Variables:
  mode:c++
  c-file-style:"stroustrup"
  c-file-offsets:((innamespace . 0)(inline-open . 0))
  indent-tabs-mode:nil
  fill-column:99
  End:
*/
// vim: expandtab:shiftwidth=4:tabstop=8:softtabstop=4 :
